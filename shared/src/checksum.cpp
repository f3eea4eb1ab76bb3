#include "chunkdrive/checksum.hpp"

#include <array>

namespace chunkdrive::checksum
{

    namespace
    {
        constexpr std::uint32_t kPolynomial = 0xEDB88320u;

        constexpr std::array<std::uint32_t, 256> make_table()
        {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t i = 0; i < table.size(); ++i)
            {
                std::uint32_t c = i;
                for (int bit = 0; bit < 8; ++bit)
                {
                    c = (c & 1u) ? (kPolynomial ^ (c >> 1)) : (c >> 1);
                }
                table[i] = c;
            }
            return table;
        }

        constexpr auto kTable = make_table();

        static_assert(kTable[1] == 0x77073096u, "CRC-32 table generation is broken");
    } // namespace

    std::uint32_t crc32_update(std::uint32_t state, std::span<const std::byte> data) noexcept
    {
        for (const auto byte : data)
        {
            state = (state >> 8) ^ kTable[(state ^ static_cast<std::uint32_t>(byte)) & 0xFFu];
        }
        return state;
    }

    std::uint32_t crc32(std::span<const std::byte> data) noexcept
    {
        return crc32_finalize(crc32_update(kCrc32Seed, data));
    }

} // namespace chunkdrive::checksum
