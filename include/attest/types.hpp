#pragma once

#include <chrono>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace attest
{

    /**
     * Nanosecond UTC instant. Zone-free by construction; offsets only exist
     * in the textual RFC 3339 form.
     */
    using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

    /**
     * Error codes for ledger operations
     */
    enum class ErrorCode
    {
        AlreadyAcknowledged,
        SubjectChanged,
        InvalidKeyMaterial,
        NonceReused,
        InvalidInput,
        NotFound,
        StorageError,
        CryptoError,
        ConfigError,
        ParsingError,
        IOError
    };

    std::string_view error_code_to_string(ErrorCode code);

    /**
     * Ledger error with code and message
     */
    class LedgerError : public std::runtime_error
    {
    public:
        ErrorCode code;

        LedgerError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static LedgerError already_acknowledged(const std::string &msg)
        {
            return LedgerError(ErrorCode::AlreadyAcknowledged, msg);
        }

        static LedgerError subject_changed(const std::string &msg)
        {
            return LedgerError(ErrorCode::SubjectChanged, msg);
        }

        static LedgerError invalid_key_material(const std::string &msg)
        {
            return LedgerError(ErrorCode::InvalidKeyMaterial, msg);
        }

        static LedgerError nonce_reused(const std::string &msg)
        {
            return LedgerError(ErrorCode::NonceReused, msg);
        }

        static LedgerError invalid_input(const std::string &msg)
        {
            return LedgerError(ErrorCode::InvalidInput, msg);
        }

        static LedgerError not_found(const std::string &msg)
        {
            return LedgerError(ErrorCode::NotFound, msg);
        }

        static LedgerError storage(const std::string &msg)
        {
            return LedgerError(ErrorCode::StorageError, msg);
        }

        static LedgerError crypto(const std::string &msg)
        {
            return LedgerError(ErrorCode::CryptoError, msg);
        }

        static LedgerError config(const std::string &msg)
        {
            return LedgerError(ErrorCode::ConfigError, msg);
        }

        static LedgerError parsing(const std::string &msg)
        {
            return LedgerError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, LedgerError>;

} // namespace attest
