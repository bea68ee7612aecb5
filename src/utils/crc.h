#ifndef BIRCH_UTILS_CRC_H
#define BIRCH_UTILS_CRC_H

#include <array>
#include <cstdint>
#include "birch/slice.h"

namespace Birch {

namespace Impl {

    // Reflected CRC-32 (polynomial 0xEDB88320), the one used by zlib.
    inline constexpr auto make_crc_table() noexcept -> std::array<std::uint32_t, 256>
    {
        std::array<std::uint32_t, 256> table {};
        for (std::uint32_t i {}; i < 256; ++i) {
            auto c = i;
            for (int k {}; k < 8; ++k)
                c = (c & 1) ? 0xEDB88320U ^ (c >> 1) : c >> 1;
            table[i] = c;
        }
        return table;
    }

    inline constexpr auto CRC_TABLE = make_crc_table();

} // namespace Impl

inline auto crc_32(Slice data) noexcept -> std::uint32_t
{
    std::uint32_t crc {0xFFFFFFFFU};
    for (Size i {}, n {data.size()}; i < n; ++i)
        crc = Impl::CRC_TABLE[(crc ^ static_cast<std::uint8_t>(data[i])) & 0xFF] ^ (crc >> 8);
    return crc ^ 0xFFFFFFFFU;
}

} // namespace Birch

#endif // BIRCH_UTILS_CRC_H
