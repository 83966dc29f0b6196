//
// Created by igor on 14/08/2025.
//

#include <pngstash/chunk.hh>
#include <pngstash/exceptions.hh>

#include <ostream>
#include <utility>

#include "input.hh"
#include "crc.hh"

namespace pngstash {

    namespace {
        void check_length(const chunk_type& type, std::uint64_t size) {
            THROW_FORMAT_UNLESS(size <= chunk::max_length, chunk_too_large,
                                "Payload of ", size, " bytes for chunk ", type,
                                " does not fit in the 32 bit length field");
        }
    }

    chunk::chunk(const chunk_type& type, byte_buffer payload)
        : m_type(type), m_payload(std::move(payload)) {
        check_length(m_type, m_payload.size());
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : m_type(type) {
        check_length(m_type, text.size());
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        m_payload.assign(first, first + text.size());
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        THROW_PARSE_IF(size < frame_overhead, truncated_frame,
                       "Chunk frame needs at least ", frame_overhead, " bytes, got ", size);

        byte_reader in(data, size);
        auto length = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        // The length must leave room for the trailing CRC
        THROW_PARSE_IF(static_cast<std::uint64_t>(length) + 4 > in.remaining(), truncated_frame,
                       "Chunk ", type, " declares ", length, " payload bytes but only ",
                       in.remaining() - 4, " are available");

        auto payload = in.read_exact(length);
        auto stored_crc = in.read<std::uint32_t>(byte_order::big);
        auto computed_crc = chunk_crc(type, payload.data(), payload.size());

        if (stored_crc != computed_crc) {
            throw crc_mismatch_error(stored_crc, computed_crc, build_error_msg(
                "CRC mismatch in chunk ", type, ": stored ", stored_crc, ", computed ", computed_crc));
        }

        return {type, std::move(payload)};
    }

    std::uint32_t chunk::checksum() const {
        return chunk_crc(m_type, m_payload.data(), m_payload.size());
    }

    std::string chunk::payload_as_text() const {
        auto bad = find_invalid_utf8(m_payload.data(), m_payload.size());
        if (bad != m_payload.size()) {
            THROW_FORMAT(utf8_decode_error,
                         "Payload of chunk ", m_type, " is not valid UTF-8 (invalid byte at offset ", bad, ")");
        }
        return {reinterpret_cast<const char*>(m_payload.data()), m_payload.size()};
    }

    byte_buffer chunk::serialize() const {
        byte_buffer out;
        out.reserve(frame_size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(byte_buffer& out) const {
        byte_writer w(out);
        w.write(length(), byte_order::big);
        w.write_chunk_type(m_type);
        w.write(m_payload.data(), m_payload.size());
        w.write(checksum(), byte_order::big);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Length: " << c.length() << "\n";
        os << "Type: " << c.type() << "\n";
        os << "Data: " << c.payload().size() << " bytes\n";
        os << "CRC: " << c.checksum() << "\n";
        return os;
    }

    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto lead = std::to_integer<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                return i;
            }

            if (extra >= size - i) {
                return i;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                auto cont = std::to_integer<std::uint8_t>(data[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return i;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates and values above U+10FFFF
            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return i;
            }
            i += extra + 1;
        }
        return size;
    }
}
