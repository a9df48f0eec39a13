/**
 * @file endian.hh
 * @brief Big-endian load/store helpers for chunk length and CRC fields
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Converts between native and big-endian (network) order
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Reads 4 bytes at src as a big-endian unsigned value
    inline std::uint32_t load_be32(const std::uint8_t* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    // Writes value as 4 big-endian bytes at dst
    inline void store_be32(std::uint32_t value, std::uint8_t* dst) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
