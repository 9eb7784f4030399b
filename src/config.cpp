#include "attest/config.hpp"
#include <spdlog/common.h>
#include <toml++/toml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace attest
{
    namespace
    {
        std::string trim(std::string s)
        {
            auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return {};
            auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        void parse_toml(const toml::table &tbl, LedgerConfig &cfg)
        {
            if (auto storage = tbl["storage"].as_table())
            {
                if (auto backend = (*storage)["backend"].value<std::string>())
                    cfg.storage.backend = *backend;
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto signing = tbl["signing"].as_table())
            {
                if (auto key = (*signing)["private_key"].value<std::string>())
                {
                    auto trimmed = trim(*key);
                    if (!trimmed.empty())
                        cfg.signing.private_key_b64 = trimmed;
                }
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto pattern = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *pattern;
            }
        }

    } // namespace

    Result<LedgerConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(LedgerError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<LedgerConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        LedgerConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(LedgerError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<LedgerConfig> ConfigLoader::from_env()
    {
        LedgerConfig cfg{};
        apply_env_overrides(cfg);
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(LedgerConfig &cfg)
    {
        if (const char *backend = std::getenv("ATTEST_STORAGE_BACKEND"))
            cfg.storage.backend = backend;
        if (const char *path = std::getenv("ATTEST_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *key = std::getenv("ATTEST_ED25519_PRIVATE_KEY"))
        {
            auto trimmed = trim(key);
            if (!trimmed.empty())
                cfg.signing.private_key_b64 = trimmed;
        }
        if (const char *level = std::getenv("ATTEST_LOG_LEVEL"))
            cfg.logging.level = level;
    }

    Result<void> ConfigLoader::validate(const LedgerConfig &cfg)
    {
        if (cfg.storage.backend != "rocksdb" && cfg.storage.backend != "memory")
        {
            return std::unexpected(LedgerError::config(
                "storage.backend must be 'rocksdb' or 'memory', got '" + cfg.storage.backend + "'"));
        }
        if (cfg.storage.backend == "rocksdb" && cfg.storage.rocksdb_path.empty())
        {
            return std::unexpected(LedgerError::config("storage.rocksdb_path must not be empty"));
        }

        // spdlog maps unknown names to "off"; only accept "off" when spelled out
        auto level = spdlog::level::from_str(cfg.logging.level);
        if (level == spdlog::level::off && cfg.logging.level != "off")
        {
            return std::unexpected(LedgerError::config("Unknown logging.level: " + cfg.logging.level));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const LedgerConfig &cfg)
    {
        nlohmann::json j;
        j["storage"] = {
            {"backend", cfg.storage.backend},
            {"rocksdb_path", cfg.storage.rocksdb_path}};
        j["signing"] = {{"has_private_key", cfg.signing.private_key_b64.has_value()}};
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        return j;
    }

} // namespace attest
