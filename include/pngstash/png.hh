/**
 * @file png.hh
 * @brief In-memory model of a whole PNG file
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <array>
#include <vector>
#include <string_view>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <pngstash/chunk.hh>
#include <pngstash/parse_options.hh>
#include <pngstash/export_pngstash.h>

namespace pngstash {

    /**
     * @class png
     * @brief The fixed PNG signature followed by an ordered list of chunks
     *
     * A png is either parsed from a complete buffer or built empty and
     * filled with append_chunk(). The chunk order is kept through every
     * mutation and written back unchanged by serialize().
     */
    class PNGSTASH_EXPORT png {
    public:
        static constexpr std::array<std::uint8_t, 8> standard_header = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        png() = default;

        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG buffer
         *
         * All or nothing: on any error no png is produced and the error
         * of the failing step is propagated unchanged.
         *
         * @throws parse_error (invalid_signature, truncated_frame, trailing_bytes, chunk_too_large)
         * @throws crc_mismatch_error
         */
        static png parse(const void* data, std::size_t size, const parse_options& options = parse_options{});

        static png parse(const byte_buffer& buffer, const parse_options& options = parse_options{}) {
            return parse(buffer.data(), buffer.size(), options);
        }

        [[nodiscard]] static const std::array<std::uint8_t, 8>& signature() { return standard_header; }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @param type_text Four letter chunk type
         * @return The removed chunk
         * @throws format_error (invalid_chunk_type_chars) for bad type text
         * @throws lookup_error (chunk_not_found) if no chunk has that type
         */
        chunk remove_chunk(std::string_view type_text);

        // First chunk of the given type, nullptr if there is none
        [[nodiscard]] const chunk* find_chunk(const chunk_type& type) const;

        // All chunks of the given type in stream order
        [[nodiscard]] std::vector<const chunk*> chunks_by_type(const chunk_type& type) const;

        // Signature followed by every chunk frame
        [[nodiscard]] byte_buffer serialize() const;

        // Lists every chunk in order
        friend PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngstash
