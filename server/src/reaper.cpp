#include "chunkdrive/server/reaper.hpp"

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    Reaper::Reaper(SessionRegistry &registry, std::chrono::seconds inactivity_ceiling)
        : registry_(registry), inactivity_ceiling_(inactivity_ceiling) {}

    std::size_t Reaper::sweep(Clock::time_point now)
    {
        // Expired sessions are already marked evicted, so no writer touches their
        // scratch areas any more and the deletion can run without locks.
        const auto expired = registry_.take_expired(now, inactivity_ceiling_);
        for (const auto &session : expired)
        {
            std::error_code ec;
            std::filesystem::remove_all(session->temp_area, ec);
            if (ec)
            {
                spdlog::warn("Could not remove scratch area {}: {}", session->temp_area.string(), ec.message());
            }
            spdlog::info("Reaped abandoned upload {} ({} of {} chunks received)", session->target_path().string(),
                         session->received_count, session->total_chunks);
        }
        return expired.size();
    }

    void Reaper::start(asio::io_context &io_context, std::chrono::seconds period)
    {
        period_ = period;
        timer_ = std::make_unique<asio::steady_timer>(io_context);
        schedule();
    }

    void Reaper::schedule()
    {
        timer_->expires_after(period_);
        timer_->async_wait([this](const std::error_code &ec)
                           {
                               if (ec)
                               {
                                   return;
                               }
                               try
                               {
                                   sweep();
                               }
                               catch (const std::exception &ex)
                               {
                                   spdlog::error("Reaper sweep failed: {}", ex.what());
                               }
                               schedule();
                           });
    }

} // namespace chunkdrive::server
