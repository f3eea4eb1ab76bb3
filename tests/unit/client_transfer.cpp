#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrive/checksum.hpp"
#include "chunkdrive/client/chunk_transport.hpp"
#include "chunkdrive/client/progress_tracker.hpp"
#include "chunkdrive/client/transfer_executor.hpp"
#include "chunkdrive/server/chunk_receiver.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/finalizer.hpp"
#include "chunkdrive/server/path_guard.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/transfer_error.hpp"

using namespace chunkdrive;
using namespace chunkdrive::client;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string pattern(std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>('a' + (i * 7) % 26);
        }
        return content;
    }

    // A receiver running in-process; transports hand chunks to it directly.
    struct LocalServer
    {
        explicit LocalServer(const std::filesystem::path &root)
            : paths(root / "files"), registry(root / "staging"), finalizer(registry),
              receiver(paths, registry, writer, finalizer)
        {
        }

        server::PathGuard paths;
        server::SessionRegistry registry;
        server::ChunkWriter writer;
        server::Finalizer finalizer;
        server::ChunkReceiver receiver;
    };

    // Decides per attempt whether a chunk is dropped before reaching the receiver.
    using DropRule = std::function<bool(std::uint64_t index, std::size_t attempt)>;

    // Shared by every transport a harness hands out.
    struct TransportStats
    {
        std::mutex mutex;
        std::vector<std::size_t> attempts;
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};
    };

    class LocalTransport : public ChunkTransport
    {
    public:
        LocalTransport(LocalServer &server, std::shared_ptr<TransportStats> stats, DropRule drop)
            : server_(server), stats_(std::move(stats)), drop_(std::move(drop))
        {
        }

        protocol::ChunkAck send_chunk(const protocol::ChunkMetadata &metadata,
                                      std::span<const std::byte> payload) override
        {
            const auto now_in_flight = ++stats_->in_flight;
            auto seen = stats_->max_in_flight.load();
            while (now_in_flight > seen && !stats_->max_in_flight.compare_exchange_weak(seen, now_in_flight))
            {
            }
            struct Leave
            {
                std::atomic<int> &counter;
                ~Leave() { --counter; }
            } leave{stats_->in_flight};

            // Keeps the request open long enough for the other workers to overlap with it.
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return deliver(metadata, payload);
        }

    private:
        protocol::ChunkAck deliver(const protocol::ChunkMetadata &metadata, std::span<const std::byte> payload)
        {
            std::size_t attempt = 0;
            {
                std::lock_guard lock(stats_->mutex);
                if (stats_->attempts.size() <= metadata.chunk_index)
                {
                    stats_->attempts.resize(metadata.chunk_index + 1, 0);
                }
                attempt = ++stats_->attempts[metadata.chunk_index];
            }
            if (drop_ && drop_(metadata.chunk_index, attempt))
            {
                throw TransferFailure(ErrorCode::TransportFailure, "connection reset");
            }
            try
            {
                return server_.receiver.receive(metadata, payload);
            }
            catch (const server::TransferError &ex)
            {
                throw TransferFailure(ex.code(), ex.what());
            }
        }

        LocalServer &server_;
        std::shared_ptr<TransportStats> stats_;
        DropRule drop_;
    };

    struct Harness
    {
        explicit Harness(const std::string &name)
            : root(prepare(name)), server(root / "server")
        {
        }

        ~Harness()
        {
            cleanup_path(root);
        }

        static std::filesystem::path prepare(const std::string &name)
        {
            const auto path = std::filesystem::temp_directory_path() / ("chunkdrive_client_" + name);
            cleanup_path(path);
            std::filesystem::create_directories(path / "source");
            return path;
        }

        TransportFactory factory(DropRule drop = nullptr)
        {
            return [this, drop]()
            {
                return std::make_unique<LocalTransport>(server, stats, drop);
            };
        }

        std::size_t attempts_for(std::uint64_t index)
        {
            std::lock_guard lock(stats->mutex);
            return index < stats->attempts.size() ? stats->attempts[index] : 0;
        }

        std::filesystem::path source(const std::string &name, const std::string &content)
        {
            const auto path = root / "source" / name;
            write_file(path, content);
            return path;
        }

        std::filesystem::path root;
        LocalServer server;
        std::shared_ptr<TransportStats> stats = std::make_shared<TransportStats>();
    };

    ExecutorOptions small_chunks(std::size_t max_attempts = 3)
    {
        return ExecutorOptions{
            .concurrency = 3,
            .max_attempts = max_attempts,
            .retry_delay = std::chrono::milliseconds(0),
            .target_dir = "incoming",
            .use_upload_token = true,
            .chunk_size = 16,
        };
    }

    void test_upload_file_reassembles()
    {
        Harness harness("roundtrip");
        const auto content = pattern(100);
        const auto path = harness.source("roundtrip.bin", content);

        TransferExecutor executor(harness.factory(), small_chunks());
        const auto result = executor.upload_file(path);
        assert(result.ok());
        assert(result.assembled);
        assert(result.plan.total_chunks == 7);
        assert(result.acknowledged_chunks == 7);
        assert(result.upload_token.has_value());
        assert(result.file_checksum.has_value());

        std::vector<std::byte> bytes(content.size());
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(content[i]);
        }
        assert(*result.file_checksum == checksum::crc32(bytes));
        assert(read_file(harness.server.paths.base() / "incoming" / "roundtrip.bin") == content);
        assert(harness.server.registry.size() == 0);
    }

    void test_in_flight_chunks_bounded_by_concurrency()
    {
        Harness harness("in_flight");
        const auto content = pattern(16 * 40);
        const auto path = harness.source("many.bin", content);

        auto options = small_chunks();
        options.concurrency = 4;
        TransferExecutor executor(harness.factory(), options);
        const auto result = executor.upload_file(path);
        assert(result.ok());
        assert(result.plan.total_chunks == 40);

        const auto peak = harness.stats->max_in_flight.load();
        assert(peak <= 4);
        assert(peak > 1);
        assert(harness.stats->in_flight.load() == 0);
        assert(read_file(harness.server.paths.base() / "incoming" / "many.bin") == content);
    }

    void test_empty_file_without_token()
    {
        Harness harness("empty");
        const auto path = harness.source("empty.txt", "");

        auto options = small_chunks();
        options.use_upload_token = false;
        options.chunk_size.reset();
        TransferExecutor executor(harness.factory(), options);
        const auto result = executor.upload_file(path);
        assert(result.ok());
        assert(result.assembled);
        assert(result.plan.total_chunks == 1);
        assert(!result.upload_token.has_value());
        assert(std::filesystem::file_size(harness.server.paths.base() / "incoming" / "empty.txt") == 0);
    }

    void test_transient_failures_are_retried()
    {
        Harness harness("flaky");
        const auto content = pattern(64);
        const auto path = harness.source("flaky.bin", content);

        TransferExecutor executor(harness.factory([](std::uint64_t, std::size_t attempt)
                                                  { return attempt == 1; }),
                                  small_chunks(2));
        const auto result = executor.upload_file(path);
        assert(result.ok());
        assert(result.assembled);
        for (std::uint64_t i = 0; i < result.plan.total_chunks; ++i)
        {
            assert(harness.attempts_for(i) == 2);
        }
        assert(read_file(harness.server.paths.base() / "incoming" / "flaky.bin") == content);
    }

    void test_exhausted_chunks_are_reported_and_reoffered()
    {
        Harness harness("exhausted");
        const auto content = pattern(50);
        const auto path = harness.source("partial.bin", content);

        auto healthy = std::make_shared<std::atomic<bool>>(false);
        TransferExecutor executor(harness.factory([healthy](std::uint64_t index, std::size_t)
                                                  { return index == 1 && !healthy->load(); }),
                                  small_chunks(2));
        const auto first = executor.upload_file(path);
        assert(!first.ok());
        assert(!first.assembled);
        assert(first.failures.size() == 1);
        assert(first.failures[0].index == 1);
        assert(first.failures[0].error == ErrorCode::TransportFailure);
        assert(first.failures[0].attempts == 2);
        assert(first.acknowledged_chunks == first.plan.total_chunks - 1);
        assert(!std::filesystem::exists(harness.server.paths.base() / "incoming" / "partial.bin"));

        healthy->store(true);
        const auto second = executor.retry_failed(first);
        assert(second.ok());
        assert(second.assembled);
        assert(second.upload_token == first.upload_token);
        assert(harness.attempts_for(0) == 1);
        assert(harness.attempts_for(1) == 3);
        assert(read_file(harness.server.paths.base() / "incoming" / "partial.bin") == content);
    }

    void test_transport_creation_failure()
    {
        Harness harness("no_transport");
        const auto path = harness.source("never.bin", pattern(40));

        TransportFactory broken = []() -> std::unique_ptr<ChunkTransport>
        {
            throw TransferFailure(ErrorCode::TransportFailure, "connection refused");
        };
        TransferExecutor executor(broken, small_chunks());
        const auto result = executor.upload_file(path);
        assert(!result.ok());
        assert(result.failures.size() == result.plan.total_chunks);
        for (const auto &failure : result.failures)
        {
            assert(failure.error == ErrorCode::TransportFailure);
            assert(failure.attempts == 0);
        }
        assert(result.acknowledged_chunks == 0);
    }

    void test_missing_source_file()
    {
        Harness harness("missing_source");
        TransferExecutor executor(harness.factory(), small_chunks());
        const auto result = executor.upload_file(harness.root / "source" / "absent.bin");
        assert(!result.ok());
        assert(result.error.has_value());
    }

    void test_progress_tracker_throttles()
    {
        using namespace std::chrono_literals;
        auto clock = std::chrono::steady_clock::time_point{};
        std::vector<std::uint64_t> reports;
        ProgressTracker tracker(
            100, [&](const ProgressSnapshot &snapshot)
            { reports.push_back(snapshot.acknowledged_bytes); },
            100ms, [&]
            { return clock; });

        tracker.add(10);
        tracker.add(10);
        assert(reports.size() == 1 && reports[0] == 10);

        clock += 150ms;
        tracker.add(30);
        assert(reports.size() == 2 && reports[1] == 50);

        clock += 10ms;
        tracker.add(500);
        assert(reports.size() == 2);
        assert(tracker.snapshot().acknowledged_bytes == 100);
        assert(tracker.snapshot().fraction() == 1.0);

        tracker.finish();
        assert(reports.size() == 3 && reports[2] == 100);
        tracker.finish();
        assert(reports.size() == 3);

        for (std::size_t i = 1; i < reports.size(); ++i)
        {
            assert(reports[i] >= reports[i - 1]);
        }
    }

    void test_upload_batch()
    {
        Harness harness("batch");
        const auto first = harness.source("first.bin", pattern(40));
        const auto second = harness.source("second.bin", pattern(33));
        const auto unsafe = harness.source("a..b", "x");
        const auto directory = harness.root / "source" / "folder";
        std::filesystem::create_directories(directory);

        // Attempts are counted per chunk index across the batch: chunk 0 of the
        // first file is dropped twice and only gets through in the third round.
        TransferExecutor executor(harness.factory([](std::uint64_t index, std::size_t attempt)
                                                  { return index == 0 && attempt <= 2; }),
                                  small_chunks(1));

        std::mutex reports_mutex;
        std::vector<ProgressSnapshot> reports;
        const auto entries = upload_batch(executor, {first, unsafe, directory, second}, 3,
                                          [&](const ProgressSnapshot &snapshot)
                                          {
                                              std::lock_guard lock(reports_mutex);
                                              reports.push_back(snapshot);
                                          },
                                          std::chrono::milliseconds(0));

        assert(entries.size() == 4);
        assert(entries[0].ok());
        assert(entries[1].rejected.has_value());
        assert(entries[2].rejected.has_value());
        assert(entries[3].ok());

        assert(!reports.empty());
        for (std::size_t i = 1; i < reports.size(); ++i)
        {
            assert(reports[i].acknowledged_bytes >= reports[i - 1].acknowledged_bytes);
        }
        assert(reports.back().total_bytes == 73);
        assert(reports.back().acknowledged_bytes == 73);
        assert(read_file(harness.server.paths.base() / "incoming" / "first.bin") == pattern(40));
        assert(read_file(harness.server.paths.base() / "incoming" / "second.bin") == pattern(33));
    }

} // namespace

void run_client_transfer_tests()
{
    test_upload_file_reassembles();
    test_in_flight_chunks_bounded_by_concurrency();
    test_empty_file_without_token();
    test_transient_failures_are_retried();
    test_exhausted_chunks_are_reported_and_reoffered();
    test_transport_creation_failure();
    test_missing_source_file();
    test_progress_tracker_throttles();
    test_upload_batch();
}
