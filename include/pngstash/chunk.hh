/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC protected PNG chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <pngstash/export_pngstash.h>
#include <pngstash/chunk_type.hh>

namespace pngstash {

    using byte_buffer = std::vector<std::byte>;

    /**
     * @class chunk
     * @brief Chunk type plus opaque payload
     *
     * Wire layout of a chunk frame:
     * @code
     *   length (4, BE) | type (4) | payload (length) | crc (4, BE)
     * @endcode
     * Length and CRC are never stored; both are recomputed from the
     * payload whenever they are requested or serialized.
     */
    class PNGSTASH_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t frame_overhead = 12;

        /// Largest payload the 32 bit length field can describe
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @throws format_error (chunk_too_large) if the payload is longer than max_length
         */
        chunk(const chunk_type& type, byte_buffer payload);

        // Payload taken from the bytes of text
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief Parse the chunk frame at the start of a buffer
         * @param data Start of the frame
         * @param size Bytes available; anything after the frame is ignored
         * @return Parsed chunk, frame_size() tells how many bytes it used
         * @throws parse_error (truncated_frame) if the frame does not fit in size
         * @throws crc_mismatch_error if the stored CRC is wrong
         */
        static chunk parse(const void* data, std::size_t size);

        static chunk parse(const byte_buffer& frame) {
            return parse(frame.data(), frame.size());
        }

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const byte_buffer& payload() const { return m_payload; }

        // Payload size in bytes
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_payload.size()); }

        // CRC-32 over type and payload
        [[nodiscard]] std::uint32_t checksum() const;

        // Size of the serialized frame
        [[nodiscard]] std::size_t frame_size() const { return m_payload.size() + frame_overhead; }

        /**
         * @brief Payload decoded as UTF-8 text
         * @throws format_error (utf8_decode_error) if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string payload_as_text() const;

        // Full frame with freshly computed length and CRC
        [[nodiscard]] byte_buffer serialize() const;

        // Append the frame to out
        void serialize_to(byte_buffer& out) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_payload == o.m_payload; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        // Multi-line summary: length, type, payload size and CRC
        friend PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk_type m_type;
        byte_buffer m_payload;
    };

    /**
     * @brief Position of the first byte that breaks UTF-8 well-formedness
     * @return size if the whole range is valid
     */
    PNGSTASH_EXPORT std::size_t find_invalid_utf8(const std::byte* data, std::size_t size);

} // namespace pngstash
