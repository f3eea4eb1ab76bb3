#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/server/upload_session.hpp"

namespace chunkdrive::server
{

    class SessionRegistry
    {
    public:
        struct Resolution
        {
            std::shared_ptr<UploadSession> session;
            bool created{};
        };

        // Scratch areas are created below `staging_root`. Leftovers of a previous
        // process are purged here since sessions do not survive a restart.
        explicit SessionRegistry(std::filesystem::path staging_root);

        // Returns the live session for `identity` or registers a new one.
        Resolution resolve(const TransferIdentity &identity, const std::string &file_name, std::uint64_t total_chunks,
                           Clock::time_point now = Clock::now());

        std::shared_ptr<UploadSession> find(const TransferIdentity &identity) const;

        // Removes the entry if it is still `expected` (any entry when null). Idempotent.
        bool remove(const TransferIdentity &identity, const UploadSession *expected = nullptr);

        // Marks sessions idle for longer than `ceiling` as evicted and unregisters them.
        // Sessions busy with a write or a finalize are skipped for this round.
        std::vector<std::shared_ptr<UploadSession>> take_expired(Clock::time_point now, std::chrono::seconds ceiling);

        std::size_t size() const;

        const std::filesystem::path &staging_root() const noexcept { return staging_root_; }

    private:
        void purge_stale_areas();
        std::filesystem::path allocate_temp_area() const;

        std::filesystem::path staging_root_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
    };

} // namespace chunkdrive::server
