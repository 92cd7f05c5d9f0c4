//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstdint>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Converts between native and big-endian (network) order
    inline uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Read a big-endian 32-bit value from unaligned memory
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t v;
        std::memcpy(&v, src, sizeof(v));
        return swap32be(v);
    }

    // Write a 32-bit value to unaligned memory in big-endian order
    inline void store_be32(void* dst, std::uint32_t v) {
        v = swap32be(v);
        std::memcpy(dst, &v, sizeof(v));
    }
}
