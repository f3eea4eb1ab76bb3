#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace chunkdrive::client
{

    struct ProgressSnapshot
    {
        std::uint64_t acknowledged_bytes{};
        std::uint64_t total_bytes{};

        double fraction() const noexcept
        {
            return total_bytes == 0 ? 1.0 : static_cast<double>(acknowledged_bytes) / static_cast<double>(total_bytes);
        }
    };

    // Acknowledged bytes over the declared size of a whole batch. Observers are
    // called at most once per interval, always with a non-decreasing value.
    class ProgressTracker
    {
    public:
        using Callback = std::function<void(const ProgressSnapshot &)>;
        using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

        static constexpr std::chrono::milliseconds kDefaultInterval{100};

        ProgressTracker(std::uint64_t total_bytes, Callback callback,
                        std::chrono::milliseconds interval = kDefaultInterval, TimeSource now = nullptr);

        void add(std::uint64_t bytes);

        // Reports the final value even when the interval has not elapsed.
        void finish();

        ProgressSnapshot snapshot() const;

    private:
        void report_locked(std::chrono::steady_clock::time_point now);

        const std::uint64_t total_bytes_;
        const Callback callback_;
        const std::chrono::milliseconds interval_;
        const TimeSource now_;

        mutable std::mutex mutex_;
        std::uint64_t acknowledged_bytes_{0};
        std::optional<std::chrono::steady_clock::time_point> last_report_;
        std::optional<std::uint64_t> last_reported_value_;
    };

} // namespace chunkdrive::client
