#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    // Evicts sessions without activity for longer than the inactivity ceiling.
    class Reaper
    {
    public:
        Reaper(SessionRegistry &registry, std::chrono::seconds inactivity_ceiling);

        // One pass; returns the number of evicted sessions.
        std::size_t sweep(Clock::time_point now = Clock::now());

        // Sweeps every `period` on `io_context` until it stops.
        void start(asio::io_context &io_context, std::chrono::seconds period);

    private:
        void schedule();

        SessionRegistry &registry_;
        std::chrono::seconds inactivity_ceiling_;
        std::chrono::seconds period_{};
        std::unique_ptr<asio::steady_timer> timer_;
    };

} // namespace chunkdrive::server
