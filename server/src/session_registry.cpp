#include "chunkdrive/server/session_registry.hpp"

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::string_view kAreaPrefix = "upload_";
    } // namespace

    SessionRegistry::SessionRegistry(std::filesystem::path staging_root) : staging_root_(std::move(staging_root))
    {
        std::filesystem::create_directories(staging_root_);
        purge_stale_areas();
    }

    SessionRegistry::Resolution SessionRegistry::resolve(const TransferIdentity &identity, const std::string &file_name,
                                                         std::uint64_t total_chunks, Clock::time_point now)
    {
        const auto key = identity.key();
        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(key); it != sessions_.end())
        {
            return {.session = it->second, .created = false};
        }
        auto session = std::make_shared<UploadSession>(identity, file_name, total_chunks, allocate_temp_area(), now);
        sessions_.emplace(key, session);
        return {.session = std::move(session), .created = true};
    }

    std::shared_ptr<UploadSession> SessionRegistry::find(const TransferIdentity &identity) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(identity.key());
        if (it != sessions_.end())
        {
            return it->second;
        }
        return nullptr;
    }

    bool SessionRegistry::remove(const TransferIdentity &identity, const UploadSession *expected)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(identity.key());
        if (it == sessions_.end() || (expected != nullptr && it->second.get() != expected))
        {
            return false;
        }
        sessions_.erase(it);
        return true;
    }

    std::vector<std::shared_ptr<UploadSession>> SessionRegistry::take_expired(Clock::time_point now,
                                                                              std::chrono::seconds ceiling)
    {
        std::vector<std::shared_ptr<UploadSession>> expired;
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto &session = it->second;
            std::unique_lock session_lock(session->mutex, std::try_to_lock);
            if (!session_lock.owns_lock() || now - session->last_activity <= ceiling)
            {
                ++it;
                continue;
            }
            session->state = SessionState::Evicted;
            expired.push_back(session);
            session_lock.unlock();
            it = sessions_.erase(it);
        }
        return expired;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    void SessionRegistry::purge_stale_areas()
    {
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(staging_root_, ec))
        {
            const auto name = entry.path().filename().string();
            std::error_code type_ec;
            if (!entry.is_directory(type_ec) || name.rfind(kAreaPrefix, 0) != 0)
            {
                continue;
            }
            std::error_code remove_ec;
            std::filesystem::remove_all(entry.path(), remove_ec);
            if (remove_ec)
            {
                spdlog::warn("Could not remove stale scratch area {}: {}", entry.path().string(), remove_ec.message());
            }
            else
            {
                spdlog::info("Removed stale scratch area {}", entry.path().string());
            }
        }
        if (ec)
        {
            spdlog::warn("Could not scan staging directory {}: {}", staging_root_.string(), ec.message());
        }
    }

    std::filesystem::path SessionRegistry::allocate_temp_area() const
    {
        return staging_root_ / (std::string(kAreaPrefix) + chunkdrive::crypto::random_token(8));
    }

} // namespace chunkdrive::server
