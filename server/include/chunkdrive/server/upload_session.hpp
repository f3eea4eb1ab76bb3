#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chunkdrive::server
{

    using Clock = std::chrono::steady_clock;

    // Key of a logical transfer. An empty token gives the plain (name, size) keying.
    struct TransferIdentity
    {
        std::filesystem::path target_path;
        std::uint64_t total_size{};
        std::string upload_token;

        std::string key() const;

        bool operator==(const TransferIdentity &) const = default;
    };

    enum class SessionState : std::uint8_t
    {
        Active,
        Completed,
        Failed,
        Evicted
    };

    std::string_view to_string(SessionState state) noexcept;

    struct UploadSession
    {
        UploadSession(TransferIdentity identity, std::string file_name, std::uint64_t total_chunks,
                      std::filesystem::path temp_area, Clock::time_point created);

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        const TransferIdentity identity;
        const std::string file_name;
        const std::uint64_t total_chunks;
        const std::filesystem::path temp_area;

        std::uint64_t total_size() const noexcept { return identity.total_size; }
        const std::filesystem::path &target_path() const noexcept { return identity.target_path; }

        std::filesystem::path chunk_path(std::uint64_t index) const;

        // Everything below is guarded by `mutex`.
        std::mutex mutex;
        SessionState state{SessionState::Active};
        std::uint64_t received_bytes{};
        std::uint64_t received_count{};
        std::vector<bool> received;
        std::vector<std::uint32_t> chunk_sizes;
        std::uint32_t file_checksum{};
        bool has_file_checksum{};
        Clock::time_point last_activity;

        // Every index arrived and the stored chunks add up to the declared size.
        bool is_complete() const noexcept
        {
            return received_count == total_chunks && received_bytes == identity.total_size;
        }
    };

} // namespace chunkdrive::server
