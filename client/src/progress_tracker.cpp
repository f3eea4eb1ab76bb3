#include "chunkdrive/client/progress_tracker.hpp"

#include <algorithm>

namespace chunkdrive::client
{

    ProgressTracker::ProgressTracker(std::uint64_t total_bytes, Callback callback, std::chrono::milliseconds interval,
                                     TimeSource now)
        : total_bytes_(total_bytes),
          callback_(std::move(callback)),
          interval_(interval),
          now_(now ? std::move(now) : TimeSource([]
                                                 { return std::chrono::steady_clock::now(); }))
    {
    }

    void ProgressTracker::add(std::uint64_t bytes)
    {
        std::lock_guard lock(mutex_);
        acknowledged_bytes_ = std::min(total_bytes_, acknowledged_bytes_ + bytes);
        const auto now = now_();
        if (!last_report_ || now - *last_report_ >= interval_)
        {
            report_locked(now);
        }
    }

    void ProgressTracker::finish()
    {
        std::lock_guard lock(mutex_);
        if (last_reported_value_ != acknowledged_bytes_)
        {
            report_locked(now_());
        }
    }

    ProgressSnapshot ProgressTracker::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return ProgressSnapshot{.acknowledged_bytes = acknowledged_bytes_, .total_bytes = total_bytes_};
    }

    void ProgressTracker::report_locked(std::chrono::steady_clock::time_point now)
    {
        last_report_ = now;
        last_reported_value_ = acknowledged_bytes_;
        if (callback_)
        {
            // Called under the lock so concurrent workers cannot reorder reports.
            callback_(ProgressSnapshot{.acknowledged_bytes = acknowledged_bytes_, .total_bytes = total_bytes_});
        }
    }

} // namespace chunkdrive::client
