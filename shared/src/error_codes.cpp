#include "chunkdrive/error_codes.hpp"

#include <array>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            bool client_error;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok", false},
            {ErrorCode::InvalidCommand, "invalid_command", true},
            {ErrorCode::InvalidPayload, "invalid_payload", true},
            {ErrorCode::SizeMismatch, "size_mismatch", true},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", true},
            {ErrorCode::PermissionDenied, "permission_denied", true},
            {ErrorCode::Conflict, "conflict", true},
            {ErrorCode::SessionExpired, "session_expired", false},
            {ErrorCode::StorageFailure, "storage_failure", false},
            {ErrorCode::ReassemblyFailed, "reassembly_failed", false},
            {ErrorCode::Unsupported, "unsupported", true},
            {ErrorCode::Timeout, "timeout", false},
            {ErrorCode::TransportFailure, "transport_failure", false},
            {ErrorCode::InternalError, "internal_error", false},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_client_error(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.client_error;
            }
        }
        return false;
    }

} // namespace chunkdrive
