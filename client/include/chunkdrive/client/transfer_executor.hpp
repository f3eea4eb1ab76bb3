#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/client/chunk_transport.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/progress_tracker.hpp"
#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    struct ExecutorOptions
    {
        // Chunks in flight at once, one transport per slot.
        std::size_t concurrency{3};
        std::size_t max_attempts{3};
        std::chrono::milliseconds retry_delay{1000};
        std::string target_dir;
        bool use_upload_token{true};
        // Overrides the tiered chunk size.
        std::optional<std::uint64_t> chunk_size;
    };

    struct ChunkFailure
    {
        std::uint64_t index{};
        chunkdrive::ErrorCode error{chunkdrive::ErrorCode::Ok};
        std::string message;
        std::size_t attempts{};
    };

    struct FileTransferResult
    {
        std::filesystem::path path;
        std::string file_name;
        ChunkPlan plan;
        std::optional<std::string> upload_token;
        // Valid once every byte of the file went through the running checksum.
        std::optional<std::uint32_t> file_checksum;
        std::uint64_t acknowledged_chunks{};
        // Set when the receiver reported that it assembled the file.
        bool assembled{};
        std::vector<ChunkFailure> failures;
        // File-level problem, e.g. the source could not be read.
        std::optional<std::string> error;

        bool ok() const noexcept
        {
            return !error && failures.empty() && acknowledged_chunks == plan.total_chunks;
        }
    };

    // Uploads the chunks of one file with bounded concurrency and per-chunk retry.
    // The calling thread reads the file in order, feeding the running checksum,
    // while worker threads upload through their own transports.
    class TransferExecutor
    {
    public:
        TransferExecutor(TransportFactory factory, ExecutorOptions options, Logger logger = Logger{});

        FileTransferResult upload_file(const std::filesystem::path &path, ProgressTracker *progress = nullptr);

        // Re-offers only the chunks that exhausted their attempts in `previous`.
        FileTransferResult retry_failed(const FileTransferResult &previous, ProgressTracker *progress = nullptr);

        const ExecutorOptions &options() const noexcept { return options_; }

    private:
        FileTransferResult run(FileTransferResult result, const std::vector<std::uint64_t> &indices,
                               ProgressTracker *progress);

        TransportFactory factory_;
        ExecutorOptions options_;
        Logger logger_;
    };

    struct BatchEntry
    {
        std::filesystem::path path;
        std::optional<FileTransferResult> result;
        // Why the file was skipped without uploading anything.
        std::optional<std::string> rejected;

        bool ok() const noexcept { return !rejected && result && result->ok(); }
    };

    // Uploads `files` one after another. Files with unsafe names or that are not
    // regular files are skipped. A file whose chunks failed is re-offered up to
    // `rounds - 1` more times. Progress covers the whole batch.
    std::vector<BatchEntry> upload_batch(TransferExecutor &executor, const std::vector<std::filesystem::path> &files,
                                         std::size_t rounds, ProgressTracker::Callback on_progress,
                                         std::chrono::milliseconds progress_interval = ProgressTracker::kDefaultInterval);

} // namespace chunkdrive::client
