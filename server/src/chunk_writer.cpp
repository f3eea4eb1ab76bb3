#include "chunkdrive/server/chunk_writer.hpp"

#include <fstream>
#include <string>

#include "chunkdrive/checksum.hpp"
#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    namespace
    {

        void write_chunk_file(const std::filesystem::path &path, std::span<const std::byte> payload)
        {
            auto staging = path;
            staging += ".tmp";
            {
                std::ofstream out(staging, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                        "Cannot open scratch file " + staging.string());
                }
                out.write(reinterpret_cast<const char *>(payload.data()), static_cast<std::streamsize>(payload.size()));
                out.flush();
                if (!out)
                {
                    out.close();
                    std::error_code ignored;
                    std::filesystem::remove(staging, ignored);
                    throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                        "Failed writing scratch file " + staging.string());
                }
            }
            // The rename keeps a previously stored copy intact until the new one is complete.
            std::error_code ec;
            std::filesystem::rename(staging, path, ec);
            if (ec)
            {
                std::error_code ignored;
                std::filesystem::remove(staging, ignored);
                throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                    "Cannot store chunk " + path.string() + ": " + ec.message());
            }
        }

    } // namespace

    VerifiedChunk ChunkWriter::verify(const chunkdrive::protocol::ChunkMetadata &metadata,
                                      std::span<const std::byte> payload) const
    {
        if (payload.size() != metadata.chunk_size)
        {
            throw TransferError(chunkdrive::ErrorCode::SizeMismatch,
                                "Declared chunk size " + std::to_string(metadata.chunk_size) + " but received " +
                                    std::to_string(payload.size()) + " bytes");
        }
        const auto actual = chunkdrive::checksum::crc32(payload);
        if (actual != metadata.chunk_checksum)
        {
            throw TransferError(chunkdrive::ErrorCode::ChecksumMismatch,
                                "Checksum mismatch on chunk " + std::to_string(metadata.chunk_index));
        }
        return VerifiedChunk(metadata, payload);
    }

    WriteOutcome ChunkWriter::write(UploadSession &session, const VerifiedChunk &chunk, Clock::time_point now)
    {
        const auto &metadata = chunk.metadata();
        const auto payload = chunk.payload();

        std::lock_guard lock(session.mutex);
        switch (session.state)
        {
        case SessionState::Active:
            break;
        case SessionState::Evicted:
            throw TransferError(chunkdrive::ErrorCode::SessionExpired, "Upload session expired");
        case SessionState::Failed:
            throw TransferError(chunkdrive::ErrorCode::ReassemblyFailed, "Upload session failed reassembly");
        case SessionState::Completed:
            // A late retry for a transfer that was already assembled.
            return WriteOutcome{
                .received_chunks = session.received_count,
                .total_chunks = session.total_chunks,
                .received_bytes = session.received_bytes,
                .duplicate = true,
                .complete = true,
                .finalized = true,
            };
        }

        if (metadata.total_chunks != session.total_chunks || metadata.total_size != session.total_size())
        {
            throw TransferError(chunkdrive::ErrorCode::Conflict, "Chunk does not match the session's declared layout");
        }
        if (metadata.chunk_index >= session.total_chunks)
        {
            throw TransferError(chunkdrive::ErrorCode::InvalidPayload,
                                "Chunk index " + std::to_string(metadata.chunk_index) + " out of range");
        }

        const auto index = static_cast<std::size_t>(metadata.chunk_index);
        const bool duplicate = session.received[index];
        const std::uint64_t previous = duplicate ? session.chunk_sizes[index] : 0;
        const auto received_bytes = session.received_bytes - previous + payload.size();
        if (received_bytes > session.total_size())
        {
            throw TransferError(chunkdrive::ErrorCode::Conflict, "Chunks exceed the declared total size");
        }

        std::error_code ec;
        std::filesystem::create_directories(session.temp_area, ec);
        if (ec)
        {
            throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                "Cannot create scratch area " + session.temp_area.string() + ": " + ec.message());
        }
        write_chunk_file(session.chunk_path(metadata.chunk_index), payload);

        session.received[index] = true;
        if (!duplicate)
        {
            ++session.received_count;
        }
        session.chunk_sizes[index] = static_cast<std::uint32_t>(payload.size());
        session.received_bytes = received_bytes;
        session.last_activity = now;
        if (metadata.chunk_index + 1 == session.total_chunks && metadata.file_checksum != 0)
        {
            session.file_checksum = metadata.file_checksum;
            session.has_file_checksum = true;
        }

        return WriteOutcome{
            .received_chunks = session.received_count,
            .total_chunks = session.total_chunks,
            .received_bytes = session.received_bytes,
            .duplicate = duplicate,
            .complete = session.is_complete(),
            .finalized = false,
        };
    }

} // namespace chunkdrive::server
