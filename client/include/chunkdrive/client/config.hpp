#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkdrive::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::vector<std::filesystem::path> files;
        std::string target_dir;
        std::size_t concurrency{3};
        std::size_t max_attempts{3};
        std::chrono::milliseconds retry_delay{1000};
        std::chrono::seconds timeout{30};
        std::size_t rounds{1};
        bool use_upload_token{true};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkdrive::client
