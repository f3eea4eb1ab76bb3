#include "chunkdrive/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkdrive::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::size_t require_positive(int &index, int argc, char *argv[], const std::string &flag)
        {
            const auto value = std::stoull(require_value(index, argc, argv, flag));
            if (value == 0)
            {
                throw std::runtime_error(flag + " must be positive");
            }
            return static_cast<std::size_t>(value);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error("Usage: chunkdrive_send <server>:<port> <file>... [--dir <remote dir>] "
                                     "[--concurrency <n>] [--retries <n>] [--retry-delay-ms <ms>] "
                                     "[--timeout <seconds>] [--rounds <n>] [--no-token] [--log <file>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port_string = endpoint.substr(colon_pos + 1);
        config.port = static_cast<std::uint16_t>(std::stoi(port_string));

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--dir")
            {
                config.target_dir = require_value(index, argc, argv, arg);
            }
            else if (arg == "--concurrency")
            {
                config.concurrency = require_positive(index, argc, argv, arg);
            }
            else if (arg == "--retries")
            {
                config.max_attempts = require_positive(index, argc, argv, arg);
            }
            else if (arg == "--retry-delay-ms")
            {
                config.retry_delay = std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--timeout")
            {
                config.timeout = std::chrono::seconds(require_positive(index, argc, argv, arg));
            }
            else if (arg == "--rounds")
            {
                config.rounds = require_positive(index, argc, argv, arg);
            }
            else if (arg == "--no-token")
            {
                config.use_upload_token = false;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.files.emplace_back(arg);
            }
        }

        if (config.files.empty())
        {
            throw std::runtime_error("No files to upload");
        }
        return config;
    }

} // namespace chunkdrive::client
