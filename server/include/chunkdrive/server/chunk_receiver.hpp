#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/finalizer.hpp"
#include "chunkdrive/server/path_guard.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    // Maximum declared chunk count; bounds the per-session index bitmap.
    inline constexpr std::uint64_t kMaxTotalChunks = 1u << 20;

    // Handles one chunk request end to end: validation, session lookup, write,
    // and finalize once every index has arrived. Errors are thrown as TransferError.
    class ChunkReceiver
    {
    public:
        ChunkReceiver(const PathGuard &paths, SessionRegistry &registry, ChunkWriter &writer, Finalizer &finalizer,
                      bool read_only = false);

        chunkdrive::protocol::ChunkAck receive(const chunkdrive::protocol::ChunkMetadata &metadata,
                                               std::span<const std::byte> payload);

    private:
        static void validate(const chunkdrive::protocol::ChunkMetadata &metadata);

        const PathGuard &paths_;
        SessionRegistry &registry_;
        ChunkWriter &writer_;
        Finalizer &finalizer_;
        bool read_only_;
    };

} // namespace chunkdrive::server
