#include "chunkdrive/chunk_plan.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace chunkdrive
{

    namespace
    {
        struct SizeTier
        {
            std::uint64_t max_file_size;
            std::uint64_t chunk_size;
        };

        constexpr SizeTier kTiers[] = {
            {1 * kMiB, kMinChunkSize},
            {100 * kMiB, 1 * kMiB},
            {1 * kGiB, 5 * kMiB},
        };
    } // namespace

    std::uint64_t select_chunk_size(std::uint64_t file_size) noexcept
    {
        for (const auto &tier : kTiers)
        {
            if (file_size <= tier.max_file_size)
            {
                return tier.chunk_size;
            }
        }
        return kMaxChunkSize;
    }

    ChunkPlan plan_chunks(std::uint64_t file_size) noexcept
    {
        const auto chunk_size = select_chunk_size(file_size);
        return ChunkPlan{
            .file_size = file_size,
            .chunk_size = chunk_size,
            .total_chunks = file_size == 0 ? 1 : (file_size + chunk_size - 1) / chunk_size,
        };
    }

    ChunkPlan plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0 || chunk_size > kMaxChunkSize)
        {
            throw std::invalid_argument("Chunk size must be between 1 and " + std::to_string(kMaxChunkSize));
        }
        return ChunkPlan{
            .file_size = file_size,
            .chunk_size = chunk_size,
            .total_chunks = file_size == 0 ? 1 : (file_size + chunk_size - 1) / chunk_size,
        };
    }

    ChunkSlice ChunkPlan::slice(std::uint64_t index) const
    {
        if (index >= total_chunks)
        {
            throw std::out_of_range("Chunk index " + std::to_string(index) + " outside plan of " +
                                    std::to_string(total_chunks));
        }
        const auto offset = index * chunk_size;
        return ChunkSlice{
            .index = index,
            .offset = offset,
            .size = std::min(chunk_size, file_size - offset),
        };
    }

} // namespace chunkdrive
