#include "attest/types.hpp"

namespace attest
{

    std::string_view error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::AlreadyAcknowledged:
            return "AlreadyAcknowledged";
        case ErrorCode::SubjectChanged:
            return "SubjectChanged";
        case ErrorCode::InvalidKeyMaterial:
            return "InvalidKeyMaterial";
        case ErrorCode::NonceReused:
            return "NonceReused";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

} // namespace attest
