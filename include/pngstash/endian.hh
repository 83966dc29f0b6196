//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <pngstash/pngstash_config.h>

namespace pngstash {
    // Platform endianness detection using CMake-generated config
#if LIBPNGSTASH_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    constexpr uint16_t swap16(uint16_t x) {
        return static_cast<uint16_t>((x << 8) | (x >> 8));
    }

    constexpr uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    constexpr uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            std::is_integral_v <T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4);
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable <T>::value;

    // Generic swap_byte_order implementation
    template<typename T>
    constexpr T swap_byte_order(T x) noexcept {
        static_assert(is_byte_swappable_v <T>,
                      "swap_byte_order only supports integral types of 1, 2 or 4 bytes");

        if constexpr (sizeof(T) == 1) {
            // Single byte types don't need swapping
            return x;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast <T>(swap16(static_cast <uint16_t>(x)));
        } else {
            return static_cast <T>(swap32(static_cast <uint32_t>(x)));
        }
    }
}
