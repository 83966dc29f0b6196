/**
 * @file chunk_iterator.hh
 * @brief Forward iterator over the chunk frames of a PNG buffer
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <memory>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <pngstash/chunk.hh>
#include <pngstash/parse_options.hh>
#include <pngstash/export_pngstash.h>

namespace pngstash {

    class byte_reader;

    /**
     * @class chunk_iterator
     * @brief Iterator for sequential traversal of PNG chunk frames
     *
     * Validates the signature on construction, then parses one frame per
     * step. The buffer is not copied and must outlive the iterator.
     */
    class PNGSTASH_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk value;                 ///< Parsed chunk (CRC already verified)
            std::uint64_t file_offset;   ///< Offset of the frame's length field in the buffer
            std::size_t index;           ///< Position of the chunk in the stream (0 = first)
        };

        /**
         * @brief Start iterating a buffer
         * @param data Buffer holding signature and frames
         * @param size Buffer size
         * @param options Parse options
         * @throws parse_error (invalid_signature) if the buffer does not start with the PNG signature
         */
        chunk_iterator(const void* data, std::size_t size, const parse_options& options = parse_options{});

        explicit chunk_iterator(const byte_buffer& buffer, const parse_options& options = parse_options{})
            : chunk_iterator(buffer.data(), buffer.size(), options) {}

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information (const version)
         * @return Const reference to current chunk information
         */
        const chunk_info& current() const { return *m_current; }

        /**
         * @brief Get current chunk information (mutable version)
         * @return Reference to current chunk information
         */
        chunk_info& current() { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        void advance();

        // Read next frame at current position, false at end of buffer
        bool read_next_chunk();

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        std::unique_ptr<byte_reader> m_reader;
        std::optional<chunk_info> m_current;
        std::size_t m_count = 0;
        bool m_ended = true;
        parse_options m_options;
    };

} // namespace pngstash
