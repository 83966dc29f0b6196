/**
 * @file chunk_type.hh
 * @brief Four byte PNG chunk type code and its property bits
 * @author Igor
 * @date 10/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <iosfwd>
#include <stdexcept>
#include <pngstash/export_pngstash.h>

namespace pngstash {

    /**
     * @class chunk_type
     * @brief Immutable 4-byte chunk type code
     *
     * Each of the four bytes carries one property in bit 5 (0x20), which is
     * also the ASCII lower-case bit:
     *  - byte 0: ancillary bit (clear = critical)
     *  - byte 1: private bit (clear = public)
     *  - byte 2: reserved bit (must be clear)
     *  - byte 3: safe-to-copy bit (set = safe to copy)
     *
     * Codes built from text are always alphabetic. Codes built from raw
     * bytes may hold anything and are then reported by is_valid().
     */
    class PNGSTASH_EXPORT chunk_type {
    public:
        static constexpr std::uint8_t property_bit = 0x20;

        // Constructor from 4 individual bytes (no validation)
        constexpr chunk_type(std::uint8_t c0, std::uint8_t c1, std::uint8_t c2, std::uint8_t c3)
            : m_bytes{c0, c1, c2, c3} {}

        // Constructor from raw bytes (no validation)
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& b) {
            return {b[0], b[1], b[2], b[3]};
        }

        static chunk_type from_bytes(const void* data);

        // Constructor from a big-endian 32 bit value (no validation)
        static chunk_type from_uint32(std::uint32_t value);

        /**
         * @brief Construct from text
         * @param text Exactly four ASCII letters
         * @throws format_error (invalid_chunk_type_chars) otherwise
         */
        static chunk_type from_text(std::string_view text);

        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const { return m_bytes; }

        // Big-endian 32 bit view of the code
        [[nodiscard]] std::uint32_t to_uint32() const;

        /**
         * @brief Convert to text
         * @throws format_error (not_text_representable) if the bytes are not valid UTF-8
         */
        [[nodiscard]] std::string to_text() const;

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr bool is_critical() const { return (m_bytes[0] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_public() const { return (m_bytes[1] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return (m_bytes[2] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (m_bytes[3] & property_bit) != 0; }

        // All four bytes are ASCII letters
        [[nodiscard]] bool is_alphabetic() const;

        // Alphabetic and the reserved bit is clear
        [[nodiscard]] bool is_valid() const { return is_alphabetic() && is_reserved_bit_valid(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        // Writes the code, escaping non-printable bytes as \xNN
        friend PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    private:
        std::array<std::uint8_t, 4> m_bytes;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk type creation
    constexpr chunk_type operator""_ctype(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        return {
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        };
    }

} // namespace pngstash

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngstash::chunk_type> {
        std::size_t operator()(const pngstash::chunk_type& t) const noexcept {
            return pngstash::chunk_type_hash{}(t);
        }
    };
}
