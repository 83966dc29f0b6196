//
// Created by igor on 10/08/2025.
//

#include <pngstash/chunk_type.hh>
#include <pngstash/chunk.hh>
#include <pngstash/exceptions.hh>
#include <pngstash/endian.hh>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngstash {

    namespace {
        bool is_ascii_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        bool is_printable(std::uint8_t c) {
            return c >= 32 && c <= 126;
        }
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::uint8_t, 4> b{};
        std::memcpy(b.data(), data, 4);
        return from_bytes(b);
    }

    chunk_type chunk_type::from_uint32(std::uint32_t value) {
        std::array<std::uint8_t, 4> b{};
        value = swap32be(value);
        std::memcpy(b.data(), &value, 4);
        return from_bytes(b);
    }

    chunk_type chunk_type::from_text(std::string_view text) {
        THROW_FORMAT_UNLESS(text.size() == 4, invalid_chunk_type_chars,
                            "Chunk type '", text, "' must be exactly 4 characters, got ", text.size());
        THROW_FORMAT_UNLESS(std::all_of(text.begin(), text.end(), [](char c) {
                                return is_ascii_letter(static_cast<std::uint8_t>(c));
                            }), invalid_chunk_type_chars,
                            "Chunk type '", text, "' must contain only letters A-Z and a-z");
        return {
            static_cast<std::uint8_t>(text[0]),
            static_cast<std::uint8_t>(text[1]),
            static_cast<std::uint8_t>(text[2]),
            static_cast<std::uint8_t>(text[3])
        };
    }

    std::uint32_t chunk_type::to_uint32() const {
        std::uint32_t result;
        std::memcpy(&result, m_bytes.data(), 4);
        return swap32be(result);
    }

    std::string chunk_type::to_text() const {
        const auto* data = reinterpret_cast<const std::byte*>(m_bytes.data());
        if (find_invalid_utf8(data, m_bytes.size()) != m_bytes.size()) {
            std::ostringstream oss;
            oss << "Chunk type " << *this << " is not representable as text";
            throw format_error(error_kind::not_text_representable, oss.str());
        }
        return {m_bytes.begin(), m_bytes.end()};
    }

    bool chunk_type::is_alphabetic() const {
        return std::all_of(m_bytes.begin(), m_bytes.end(), is_ascii_letter);
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        // Check if hex format is set
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << t.to_uint32();
            os.flags(flags);
            os.fill(fill);
            return os;
        }
        for (std::uint8_t c : t.m_bytes) {
            if (is_printable(c)) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                auto flags = os.flags();
                auto fill = os.fill();
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c);
                os.flags(flags);
                os.fill(fill);
            }
        }
        return os;
    }
}
