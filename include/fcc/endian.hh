//
// Host byte order and 32-bit byte swapping
//

#pragma once

#include <cstdint>

#include <fcc/fcc_config.h>
#include <fcc/compiler.hh>

namespace fcc {
    // Platform endianness detection using CMake-generated config
#if LIBFCC_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) noexcept {
#if LIBFCC_HAS_BUILTIN_BSWAP
        return __builtin_bswap32(x);
#else
        return ((x << 24) | ((x << 8) & 0x00FF0000u) |
                ((x >> 8) & 0x0000FF00u) | (x >> 24));
#endif
    }
} // namespace fcc
