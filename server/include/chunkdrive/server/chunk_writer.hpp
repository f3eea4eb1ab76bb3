#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/upload_session.hpp"

namespace chunkdrive::server
{

    // A chunk whose payload length and checksum matched its metadata.
    class VerifiedChunk
    {
    public:
        const chunkdrive::protocol::ChunkMetadata &metadata() const noexcept { return *metadata_; }
        std::span<const std::byte> payload() const noexcept { return payload_; }

    private:
        friend class ChunkWriter;

        VerifiedChunk(const chunkdrive::protocol::ChunkMetadata &metadata, std::span<const std::byte> payload)
            : metadata_(&metadata), payload_(payload) {}

        const chunkdrive::protocol::ChunkMetadata *metadata_;
        std::span<const std::byte> payload_;
    };

    struct WriteOutcome
    {
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        std::uint64_t received_bytes{};
        bool duplicate{};
        bool complete{};
        // The session had already been assembled before this chunk arrived.
        bool finalized{};
    };

    class ChunkWriter
    {
    public:
        // Throws TransferError(SizeMismatch | ChecksumMismatch).
        VerifiedChunk verify(const chunkdrive::protocol::ChunkMetadata &metadata,
                             std::span<const std::byte> payload) const;

        // Persists the chunk into the session's scratch area and records it.
        // On any error the session is left exactly as it was.
        WriteOutcome write(UploadSession &session, const VerifiedChunk &chunk, Clock::time_point now = Clock::now());

        WriteOutcome write(UploadSession &session, const chunkdrive::protocol::ChunkMetadata &metadata,
                           std::span<const std::byte> payload, Clock::time_point now = Clock::now())
        {
            return write(session, verify(metadata, payload), now);
        }
    };

} // namespace chunkdrive::server
