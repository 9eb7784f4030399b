#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <cstdint>
#include <optional>
#include <string>

namespace attest
{
    /**
     * Operator-facing record of a ledger action. Emitted as one JSON line.
     */
    struct AuditEvent
    {
        std::string ts;
        std::string action; // "append", "verify", ...
        std::string subject_id;
        std::string signer_id;
        std::optional<std::uint64_t> record_id;
        std::string result; // "ok", "conflict", "corruption", ...
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;

        static AuditEvent now(std::string action, std::string result);
    };

    /** Writes audit events through the default spdlog logger */
    class AuditLogger
    {
    public:
        AuditLogger() = default;

        void log(const AuditEvent &event, spdlog::level::level_enum level = spdlog::level::info) const;
    };

    /**
     * Configure the default spdlog logger's level and pattern.
     */
    Result<void> init_logging(const LoggingConfig &cfg);

} // namespace attest
