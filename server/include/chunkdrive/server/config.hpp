#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkdrive::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds session_timeout{std::chrono::minutes{10}};
        std::chrono::seconds reap_interval{std::chrono::minutes{1}};
        std::optional<std::filesystem::path> staging_root;
        bool read_only{false};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace chunkdrive::server
