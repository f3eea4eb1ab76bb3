#include "chunkdrive/client/transfer_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "chunkdrive/checksum.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    namespace
    {

        struct ChunkJob
        {
            chunkdrive::protocol::ChunkMetadata metadata;
            std::vector<std::byte> payload;
        };

        // Hands chunks from the reading thread to the upload workers. push() blocks
        // while `capacity` chunks are waiting, which bounds buffered file data.
        class JobQueue
        {
        public:
            explicit JobQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

            void push(ChunkJob job)
            {
                std::unique_lock lock(mutex_);
                not_full_.wait(lock, [this]
                               { return jobs_.size() < capacity_ || closed_; });
                if (closed_)
                {
                    return;
                }
                jobs_.push_back(std::move(job));
                not_empty_.notify_one();
            }

            std::optional<ChunkJob> pop()
            {
                std::unique_lock lock(mutex_);
                not_empty_.wait(lock, [this]
                                { return !jobs_.empty() || closed_; });
                if (jobs_.empty())
                {
                    return std::nullopt;
                }
                auto job = std::move(jobs_.front());
                jobs_.pop_front();
                not_full_.notify_one();
                return job;
            }

            // Lets workers drain what is queued, then stop.
            void close()
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
                not_empty_.notify_all();
                not_full_.notify_all();
            }

        private:
            const std::size_t capacity_;
            std::mutex mutex_;
            std::condition_variable not_empty_;
            std::condition_variable not_full_;
            std::deque<ChunkJob> jobs_;
            bool closed_{false};
        };

        class WorkerGroup
        {
        public:
            explicit WorkerGroup(JobQueue &queue) : queue_(queue) {}

            ~WorkerGroup()
            {
                join();
            }

            template <typename Fn>
            void spawn(std::size_t count, Fn fn)
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    threads_.emplace_back(fn);
                }
            }

            void join()
            {
                queue_.close();
                for (auto &thread : threads_)
                {
                    if (thread.joinable())
                    {
                        thread.join();
                    }
                }
                threads_.clear();
            }

        private:
            JobQueue &queue_;
            std::vector<std::thread> threads_;
        };

        bool read_slice(std::ifstream &in, const ChunkSlice &slice, bool seek, std::vector<std::byte> &out)
        {
            if (seek)
            {
                in.clear();
                in.seekg(static_cast<std::streamoff>(slice.offset));
            }
            out.resize(static_cast<std::size_t>(slice.size));
            if (slice.size == 0)
            {
                return static_cast<bool>(in) || in.eof();
            }
            in.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(slice.size));
            return static_cast<std::uint64_t>(in.gcount()) == slice.size;
        }

    } // namespace

    TransferExecutor::TransferExecutor(TransportFactory factory, ExecutorOptions options, Logger logger)
        : factory_(std::move(factory)), options_(std::move(options)), logger_(std::move(logger))
    {
        options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
        options_.max_attempts = std::max<std::size_t>(options_.max_attempts, 1);
    }

    FileTransferResult TransferExecutor::upload_file(const std::filesystem::path &path, ProgressTracker *progress)
    {
        FileTransferResult result;
        result.path = path;
        result.file_name = path.filename().string();

        std::error_code ec;
        const auto file_size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            result.error = "Cannot read size of " + path.string() + ": " + ec.message();
            return result;
        }
        result.plan = options_.chunk_size ? plan_chunks(file_size, *options_.chunk_size) : plan_chunks(file_size);
        if (options_.use_upload_token)
        {
            result.upload_token = chunkdrive::crypto::random_token();
        }

        logger_.log("upload", "start ", result.file_name, " size=", file_size, " chunk_size=", result.plan.chunk_size,
                    " chunks=", result.plan.total_chunks);

        std::vector<std::uint64_t> indices(result.plan.total_chunks);
        for (std::uint64_t i = 0; i < indices.size(); ++i)
        {
            indices[i] = i;
        }
        return run(std::move(result), indices, progress);
    }

    FileTransferResult TransferExecutor::retry_failed(const FileTransferResult &previous, ProgressTracker *progress)
    {
        if (previous.failures.empty())
        {
            return previous;
        }
        FileTransferResult seed = previous;
        seed.failures.clear();
        seed.error.reset();

        std::vector<std::uint64_t> indices;
        indices.reserve(previous.failures.size());
        for (const auto &failure : previous.failures)
        {
            indices.push_back(failure.index);
        }
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        logger_.log("upload", "re-offering ", indices.size(), " chunk(s) of ", seed.file_name);
        return run(std::move(seed), indices, progress);
    }

    FileTransferResult TransferExecutor::run(FileTransferResult result, const std::vector<std::uint64_t> &indices,
                                             ProgressTracker *progress)
    {
        if (indices.empty())
        {
            return result;
        }

        std::mutex result_mutex;
        auto record_failure = [&](std::uint64_t index, chunkdrive::ErrorCode code, std::string message,
                                  std::size_t attempts)
        {
            std::lock_guard lock(result_mutex);
            result.failures.push_back(ChunkFailure{
                .index = index,
                .error = code,
                .message = std::move(message),
                .attempts = attempts,
            });
        };

        std::ifstream in(result.path, std::ios::binary);
        if (!in.is_open())
        {
            result.error = "Cannot open " + result.path.string();
            for (const auto index : indices)
            {
                record_failure(index, chunkdrive::ErrorCode::InternalError, "not sent", 0);
            }
            logger_.warn("upload", *result.error);
            return result;
        }

        const std::string file_name = result.file_name;

        auto upload_with_retry = [&](ChunkTransport &transport, const ChunkJob &job)
        {
            const auto index = job.metadata.chunk_index;
            chunkdrive::ErrorCode last_code = chunkdrive::ErrorCode::InternalError;
            std::string last_message;
            for (std::size_t attempt = 1; attempt <= options_.max_attempts; ++attempt)
            {
                try
                {
                    const auto ack = transport.send_chunk(job.metadata, job.payload);
                    {
                        std::lock_guard lock(result_mutex);
                        ++result.acknowledged_chunks;
                        if (ack.completed)
                        {
                            result.assembled = true;
                        }
                    }
                    if (progress)
                    {
                        progress->add(job.payload.size());
                    }
                    return;
                }
                catch (const TransferFailure &ex)
                {
                    last_code = ex.code();
                    last_message = ex.what();
                }
                catch (const std::exception &ex)
                {
                    last_code = chunkdrive::ErrorCode::InternalError;
                    last_message = ex.what();
                }
                logger_.warn("upload", file_name, " chunk ", index, " attempt ", attempt, "/", options_.max_attempts,
                             " failed: ", last_message);
                if (attempt < options_.max_attempts)
                {
                    std::this_thread::sleep_for(options_.retry_delay);
                }
            }
            record_failure(index, last_code, std::move(last_message), options_.max_attempts);
        };

        JobQueue queue(options_.concurrency);
        auto worker = [&]()
        {
            std::unique_ptr<ChunkTransport> transport;
            std::string transport_error = "no transport available";
            try
            {
                transport = factory_();
            }
            catch (const std::exception &ex)
            {
                transport_error = ex.what();
                logger_.warn("upload", "cannot create transport: ", ex.what());
            }

            while (auto job = queue.pop())
            {
                if (!transport)
                {
                    record_failure(job->metadata.chunk_index, chunkdrive::ErrorCode::TransportFailure,
                                   transport_error, 0);
                    continue;
                }
                upload_with_retry(*transport, *job);
            }
        };
        WorkerGroup workers(queue);
        workers.spawn(std::min<std::size_t>(options_.concurrency, indices.size()), worker);

        const auto &plan = result.plan;
        auto make_job = [&](const ChunkSlice &slice, std::vector<std::byte> payload)
        {
            chunkdrive::protocol::ChunkMetadata metadata{
                .file_name = file_name,
                .chunk_index = slice.index,
                .total_chunks = plan.total_chunks,
                .chunk_size = slice.size,
                .total_size = plan.file_size,
                .chunk_checksum = chunkdrive::checksum::crc32(payload),
                .file_checksum = 0,
                .target_dir = options_.target_dir,
                .upload_token = result.upload_token,
            };
            if (plan.is_last(slice.index) && result.file_checksum)
            {
                metadata.file_checksum = *result.file_checksum;
            }
            return ChunkJob{std::move(metadata), std::move(payload)};
        };

        // Marks every wanted chunk from `from` on as not sent after a read error.
        auto abandon = [&](std::size_t from, const std::vector<std::uint64_t> &order, std::uint64_t at_index)
        {
            result.error = "Read error at chunk " + std::to_string(at_index) + " of " + result.path.string() +
                           "; the file may have changed during upload";
            logger_.warn("upload", *result.error);
            for (std::size_t i = from; i < order.size(); ++i)
            {
                record_failure(order[i], chunkdrive::ErrorCode::InternalError, "not sent", 0);
            }
        };

        if (!result.file_checksum)
        {
            // The whole-file checksum is only known after every byte was read, so
            // the file is read front to back even when a few chunks are wanted.
            std::vector<bool> wanted(plan.total_chunks, false);
            for (const auto index : indices)
            {
                wanted[index] = true;
            }
            std::vector<std::uint64_t> pending;
            pending.reserve(indices.size());
            for (std::uint64_t index = 0; index < plan.total_chunks; ++index)
            {
                if (wanted[index])
                {
                    pending.push_back(index);
                }
            }

            chunkdrive::checksum::Crc32 running;
            std::size_t next_pending = 0;
            for (std::uint64_t index = 0; index < plan.total_chunks; ++index)
            {
                const auto slice = plan.slice(index);
                std::vector<std::byte> payload;
                if (!read_slice(in, slice, false, payload))
                {
                    abandon(next_pending, pending, index);
                    break;
                }
                running.update(payload);
                if (plan.is_last(index))
                {
                    result.file_checksum = running.value();
                }
                if (!wanted[index])
                {
                    continue;
                }
                ++next_pending;
                queue.push(make_job(slice, std::move(payload)));
            }
        }
        else
        {
            std::vector<std::uint64_t> order(indices.begin(), indices.end());
            std::sort(order.begin(), order.end());
            for (std::size_t i = 0; i < order.size(); ++i)
            {
                const auto slice = plan.slice(order[i]);
                std::vector<std::byte> payload;
                if (!read_slice(in, slice, true, payload))
                {
                    abandon(i, order, order[i]);
                    break;
                }
                queue.push(make_job(slice, std::move(payload)));
            }
        }

        workers.join();

        std::sort(result.failures.begin(), result.failures.end(),
                  [](const ChunkFailure &lhs, const ChunkFailure &rhs)
                  { return lhs.index < rhs.index; });

        if (result.ok())
        {
            logger_.log("upload", "finished ", file_name, " chunks=", result.plan.total_chunks,
                        " assembled=", result.assembled ? "yes" : "no");
        }
        else
        {
            logger_.warn("upload", "incomplete ", file_name, " acknowledged=", result.acknowledged_chunks, "/",
                         result.plan.total_chunks, " failed=", result.failures.size());
        }
        return result;
    }

    std::vector<BatchEntry> upload_batch(TransferExecutor &executor, const std::vector<std::filesystem::path> &files,
                                         std::size_t rounds, ProgressTracker::Callback on_progress,
                                         std::chrono::milliseconds progress_interval)
    {
        std::vector<BatchEntry> entries;
        entries.reserve(files.size());
        std::uint64_t total_bytes = 0;

        for (const auto &path : files)
        {
            BatchEntry entry{.path = path, .result = std::nullopt, .rejected = std::nullopt};
            std::error_code ec;
            if (!chunkdrive::protocol::is_safe_file_name(path.filename().string()))
            {
                entry.rejected = "Invalid file name";
            }
            else if (!std::filesystem::is_regular_file(path, ec))
            {
                entry.rejected = ec ? "Cannot access file: " + ec.message() : std::string{"Not a regular file"};
            }
            else
            {
                const auto size = std::filesystem::file_size(path, ec);
                if (ec)
                {
                    entry.rejected = "Cannot read file size: " + ec.message();
                }
                else
                {
                    total_bytes += size;
                }
            }
            entries.push_back(std::move(entry));
        }

        ProgressTracker tracker(total_bytes, std::move(on_progress), progress_interval);
        rounds = std::max<std::size_t>(rounds, 1);

        for (auto &entry : entries)
        {
            if (entry.rejected)
            {
                continue;
            }
            auto result = executor.upload_file(entry.path, &tracker);
            for (std::size_t round = 1; round < rounds && !result.failures.empty(); ++round)
            {
                result = executor.retry_failed(result, &tracker);
            }
            entry.result = std::move(result);
        }

        tracker.finish();
        return entries;
    }

} // namespace chunkdrive::client
