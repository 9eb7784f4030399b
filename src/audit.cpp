#include "attest/audit.hpp"
#include "attest/timestamp.hpp"
#include <spdlog/spdlog.h>

namespace attest
{

    nlohmann::json AuditEvent::to_json() const
    {
        nlohmann::json j{{"ts", ts},
                         {"action", action},
                         {"subject_id", subject_id},
                         {"signer_id", signer_id},
                         {"result", result},
                         {"details", details}};
        j["record_id"] = record_id ? nlohmann::json(*record_id) : nlohmann::json(nullptr);
        return j;
    }

    AuditEvent AuditEvent::now(std::string action, std::string result)
    {
        AuditEvent event;
        event.ts = format_rfc3339_nano(now_utc());
        event.action = std::move(action);
        event.result = std::move(result);
        return event;
    }

    void AuditLogger::log(const AuditEvent &event, spdlog::level::level_enum level) const
    {
        // Audit lines must never throw; invalid UTF-8 is replaced with U+FFFD
        spdlog::log(level, "audit {}",
                    event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    Result<void> init_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
        {
            return std::unexpected(LedgerError::config("Unknown log level: " + cfg.level));
        }
        spdlog::set_level(level);
        if (!cfg.pattern.empty())
            spdlog::set_pattern(cfg.pattern);
        return {};
    }

} // namespace attest
