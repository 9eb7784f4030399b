#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace attest
{

    struct StorageConfig
    {
        std::string backend{"rocksdb"}; // "rocksdb" or "memory"
        std::string rocksdb_path{"./data/ledger"};
    };

    struct SigningConfig
    {
        // Base64 64-byte Ed25519 private key. Absent means an ephemeral key.
        std::optional<std::string> private_key_b64;
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v"};
    };

    struct LedgerConfig
    {
        StorageConfig storage{};
        SigningConfig signing{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides:
     *
     *   ATTEST_STORAGE_BACKEND       storage.backend
     *   ATTEST_ROCKSDB_PATH          storage.rocksdb_path
     *   ATTEST_ED25519_PRIVATE_KEY   signing.private_key
     *   ATTEST_LOG_LEVEL             logging.level
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<LedgerConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<LedgerConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for running without a file. */
        static Result<LedgerConfig> from_env();

        /** Serialize config to JSON for inspection. The private key is never included. */
        static nlohmann::json to_json(const LedgerConfig &cfg);

    private:
        static void apply_env_overrides(LedgerConfig &cfg);
        static Result<void> validate(const LedgerConfig &cfg);
    };

} // namespace attest
