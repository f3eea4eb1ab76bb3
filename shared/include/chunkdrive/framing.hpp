/**
 * ChunkDrive - Length-prefixed framing for JSON envelopes and raw chunk payloads.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkdrive::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Largest frame either side accepts; covers the biggest chunk plus headroom.
    inline constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::array<std::uint8_t, kFrameHeaderSize> encode_frame_header(std::uint32_t payload_size);

    std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace chunkdrive::protocol
