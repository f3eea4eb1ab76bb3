#include <cstdlib>
#include <iostream>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chunkdrive/client/chunk_transport.hpp"
#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transfer_executor.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/version.hpp"

namespace
{

    using namespace chunkdrive::client;

    void print_entry(const BatchEntry &entry)
    {
        if (entry.rejected)
        {
            std::cout << "SKIPPED " << entry.path.string() << ": " << *entry.rejected << "\n";
            return;
        }
        const auto &result = *entry.result;
        if (result.ok())
        {
            std::cout << "OK " << entry.path.string() << " (" << result.plan.file_size << " bytes, "
                      << result.plan.total_chunks << " chunks)\n";
            return;
        }
        std::cout << "ERROR " << entry.path.string();
        if (result.error)
        {
            std::cout << ": " << *result.error;
        }
        std::cout << "\n";
        for (const auto &failure : result.failures)
        {
            std::cout << "  chunk " << failure.index << ": " << chunkdrive::to_string(failure.error) << " "
                      << failure.message << " (attempts " << failure.attempts << ")\n";
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("client", "chunkdrive_send ", chunkdrive::version(), " -> ", config.host, ":", config.port);

        const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
        TransportFactory factory = [host = config.host, port = config.port, timeout]()
        { return std::make_unique<TcpChunkTransport>(host, port, timeout); };

        ExecutorOptions options{
            .concurrency = config.concurrency,
            .max_attempts = config.max_attempts,
            .retry_delay = config.retry_delay,
            .target_dir = config.target_dir,
            .use_upload_token = config.use_upload_token,
            .chunk_size = std::nullopt,
        };
        TransferExecutor executor(std::move(factory), std::move(options), logger);

        std::mutex output_mutex;
        const auto entries = upload_batch(executor, config.files, config.rounds,
                                          [&](const ProgressSnapshot &snapshot)
                                          {
                                              std::lock_guard lock(output_mutex);
                                              std::cout << "\rUploaded " << snapshot.acknowledged_bytes << " / "
                                                        << snapshot.total_bytes << " bytes" << std::flush;
                                          });
        std::cout << "\n";

        bool all_ok = true;
        for (const auto &entry : entries)
        {
            print_entry(entry);
            all_ok = all_ok && entry.ok();
        }
        return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
