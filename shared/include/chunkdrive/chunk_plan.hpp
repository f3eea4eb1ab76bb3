/**
 * ChunkDrive - Chunk size selection and slicing of a file into chunks.
 */
#pragma once

#include <cstdint>

namespace chunkdrive
{

    inline constexpr std::uint64_t kKiB = 1024;
    inline constexpr std::uint64_t kMiB = 1024 * kKiB;
    inline constexpr std::uint64_t kGiB = 1024 * kMiB;

    inline constexpr std::uint64_t kMinChunkSize = 256 * kKiB;
    inline constexpr std::uint64_t kMaxChunkSize = 10 * kMiB;

    struct ChunkSlice
    {
        std::uint64_t index{};
        std::uint64_t offset{};
        std::uint64_t size{};
    };

    struct ChunkPlan
    {
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};

        ChunkSlice slice(std::uint64_t index) const;

        bool is_last(std::uint64_t index) const noexcept { return index + 1 == total_chunks; }
    };

    // Tiered: 256 KiB up to 1 MiB, 1 MiB up to 100 MiB, 5 MiB up to 1 GiB, 10 MiB beyond.
    std::uint64_t select_chunk_size(std::uint64_t file_size) noexcept;

    // A zero-byte file still gets one empty chunk.
    ChunkPlan plan_chunks(std::uint64_t file_size) noexcept;

    // Fixed chunk size instead of the tiered choice; must not exceed kMaxChunkSize.
    ChunkPlan plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

} // namespace chunkdrive
