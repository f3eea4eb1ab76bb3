/**
 * ChunkDrive - Shared error codes used by the sender and the receiver.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        SizeMismatch = 3,
        ChecksumMismatch = 4,
        PermissionDenied = 5,
        Conflict = 6,
        SessionExpired = 7,
        StorageFailure = 8,
        ReassemblyFailed = 9,
        Unsupported = 10,
        Timeout = 11,
        TransportFailure = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Rejections caused by the request itself; the session was not touched.
    bool is_client_error(ErrorCode code) noexcept;

} // namespace chunkdrive
