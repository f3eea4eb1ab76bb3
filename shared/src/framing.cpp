#include "chunkdrive/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace chunkdrive::protocol
{

    namespace
    {
        void check_frame_size(std::size_t size)
        {
            if (size > kMaxFrameSize)
            {
                throw std::length_error("Frame of " + std::to_string(size) + " bytes exceeds limit");
            }
        }
    } // namespace

    std::array<std::uint8_t, kFrameHeaderSize> encode_frame_header(std::uint32_t value)
    {
        return {
            static_cast<std::uint8_t>((value >> 24) & 0xFF),
            static_cast<std::uint8_t>((value >> 16) & 0xFF),
            static_cast<std::uint8_t>((value >> 8) & 0xFF),
            static_cast<std::uint8_t>(value & 0xFF),
        };
    }

    std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> buffer) noexcept
    {
        return (static_cast<std::uint32_t>(buffer[0]) << 24) |
               (static_cast<std::uint32_t>(buffer[1]) << 16) |
               (static_cast<std::uint32_t>(buffer[2]) << 8) |
               static_cast<std::uint32_t>(buffer[3]);
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        check_frame_size(text.size());
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        const auto header = encode_frame_header(static_cast<std::uint32_t>(text.size()));
        std::copy(header.begin(), header.end(), frame.begin());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = decode_frame_header(buffer.first<kFrameHeaderSize>());
        check_frame_size(payload_size);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        DecodedFrame result{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

} // namespace chunkdrive::protocol
