#include "chunkdrive/server/chunk_receiver.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    ChunkReceiver::ChunkReceiver(const PathGuard &paths, SessionRegistry &registry, ChunkWriter &writer,
                                 Finalizer &finalizer, bool read_only)
        : paths_(paths), registry_(registry), writer_(writer), finalizer_(finalizer), read_only_(read_only) {}

    chunkdrive::protocol::ChunkAck ChunkReceiver::receive(const chunkdrive::protocol::ChunkMetadata &metadata,
                                                          std::span<const std::byte> payload)
    {
        if (read_only_)
        {
            throw TransferError(chunkdrive::ErrorCode::PermissionDenied, "Server is in read-only mode");
        }
        validate(metadata);
        const auto verified = writer_.verify(metadata, payload);

        const TransferIdentity identity{
            .target_path = paths_.resolve_target(metadata.target_dir, metadata.file_name),
            .total_size = metadata.total_size,
            .upload_token = metadata.upload_token.value_or(std::string{}),
        };
        auto resolution = registry_.resolve(identity, metadata.file_name, metadata.total_chunks);
        if (resolution.created)
        {
            spdlog::info("Started chunked upload {} ({} chunks, {} bytes)", identity.target_path.string(),
                         metadata.total_chunks, metadata.total_size);
        }

        const auto outcome = writer_.write(*resolution.session, verified);
        if (outcome.duplicate)
        {
            spdlog::debug("Chunk {} of {} received again", metadata.chunk_index, metadata.file_name);
        }

        chunkdrive::protocol::ChunkAck ack{
            .received_chunks = outcome.received_chunks,
            .total_chunks = outcome.total_chunks,
            .completed = outcome.finalized,
        };
        if (outcome.complete && !outcome.finalized)
        {
            ack.completed = finalizer_.finalize(resolution.session).has_value();
        }
        return ack;
    }

    void ChunkReceiver::validate(const chunkdrive::protocol::ChunkMetadata &metadata)
    {
        if (metadata.total_chunks == 0 || metadata.total_chunks > kMaxTotalChunks)
        {
            throw TransferError(chunkdrive::ErrorCode::InvalidPayload,
                                "Invalid chunk count " + std::to_string(metadata.total_chunks));
        }
        if (metadata.chunk_index >= metadata.total_chunks)
        {
            throw TransferError(chunkdrive::ErrorCode::InvalidPayload,
                                "Chunk index " + std::to_string(metadata.chunk_index) + " out of range");
        }
        if (metadata.chunk_size > chunkdrive::kMaxChunkSize || metadata.chunk_size > metadata.total_size)
        {
            throw TransferError(chunkdrive::ErrorCode::InvalidPayload,
                                "Invalid chunk size " + std::to_string(metadata.chunk_size));
        }
        // Every chunk but a zero-byte file's only chunk carries at least one byte,
        // and no chunk carries more than the ceiling.
        const auto max_chunks = metadata.total_size == 0 ? 1 : metadata.total_size;
        const auto min_chunks = metadata.total_size == 0
                                    ? 1
                                    : (metadata.total_size + chunkdrive::kMaxChunkSize - 1) / chunkdrive::kMaxChunkSize;
        if (metadata.total_chunks > max_chunks || metadata.total_chunks < min_chunks)
        {
            throw TransferError(chunkdrive::ErrorCode::InvalidPayload,
                                "Chunk count does not fit the declared total size");
        }
    }

} // namespace chunkdrive::server
