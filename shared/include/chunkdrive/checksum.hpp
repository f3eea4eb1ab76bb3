/**
 * ChunkDrive - Streaming CRC-32 (IEEE 802.3, reflected, polynomial 0xEDB88320).
 *
 * The running state is the raw register value. Feeding A and then B with the
 * state returned for A and finalizing once gives the checksum of A followed
 * by B, which lets a whole-file checksum be built one chunk at a time.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace chunkdrive::checksum
{

    inline constexpr std::uint32_t kCrc32Seed = 0xFFFFFFFFu;

    std::uint32_t crc32_update(std::uint32_t state, std::span<const std::byte> data) noexcept;

    constexpr std::uint32_t crc32_finalize(std::uint32_t state) noexcept
    {
        return (state ^ 0xFFFFFFFFu) & 0xFFFFFFFFu;
    }

    std::uint32_t crc32(std::span<const std::byte> data) noexcept;

    class Crc32
    {
    public:
        Crc32() = default;
        explicit Crc32(std::uint32_t running_state) : state_(running_state) {}

        void update(std::span<const std::byte> data) noexcept
        {
            state_ = crc32_update(state_, data);
        }

        std::uint32_t running_state() const noexcept { return state_; }
        std::uint32_t value() const noexcept { return crc32_finalize(state_); }

    private:
        std::uint32_t state_{kCrc32Seed};
    };

} // namespace chunkdrive::checksum
