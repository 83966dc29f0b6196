//
// Created by igor on 13/08/2025.
//

#include <pngstash/chunk_iterator.hh>
#include <pngstash/exceptions.hh>
#include <pngstash/png.hh>

#include <algorithm>
#include <utility>

#include "input.hh"

namespace pngstash {

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, const parse_options& options)
        : m_reader(std::make_unique<byte_reader>(data, size)),
          m_options(options) {
        const auto& header = png::signature();
        THROW_PARSE_IF(size < header.size(), invalid_signature,
                       "Buffer of ", size, " bytes is too short for the PNG signature");
        THROW_PARSE_IF(!std::equal(header.begin(), header.end(), static_cast<const std::uint8_t*>(data)),
                       invalid_signature, "Buffer does not start with the PNG signature");

        m_reader->seek(header.size(), byte_reader::set);
        m_ended = false;

        // Read the first chunk
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        if (!read_next_chunk()) {
            m_ended = true;
            m_current.reset();
        }
    }

    bool chunk_iterator::read_next_chunk() {
        std::size_t remaining = m_reader->remaining();
        if (remaining == 0) {
            return false;
        }

        std::uint64_t start_pos = m_reader->tell();

        if (remaining < chunk::frame_overhead) {
            if (m_options.strict) {
                THROW_PARSE(trailing_bytes, remaining, " trailing bytes at offset ", start_pos,
                            " are too short to hold a chunk frame");
            }
            warn(start_pos, "trailing_bytes",
                 build_error_msg("Ignoring ", remaining, " trailing bytes at offset ", start_pos));
            return false;
        }

        // Size limit applies to complete frames, chunk::parse reports truncation
        auto declared = m_reader->peek<std::uint32_t>(byte_order::big);
        bool fits = static_cast<std::uint64_t>(declared) + chunk::frame_overhead <= remaining;
        if (fits && declared > m_options.max_chunk_size) {
            auto id = chunk_type::from_bytes(m_reader->position_ptr() + 4);
            if (m_options.strict) {
                THROW_PARSE(chunk_too_large, "Chunk '", id, "' at offset ", start_pos, " has size ",
                            declared, " bytes, which exceeds maximum allowed size of ",
                            m_options.max_chunk_size, " bytes");
            }
            warn(start_pos, "size_limit",
                 build_error_msg("Chunk '", id, "' size ", declared, " exceeds maximum ",
                                 m_options.max_chunk_size));
        }

        auto parsed = chunk::parse(m_reader->position_ptr(), remaining);
        m_reader->seek(parsed.frame_size(), byte_reader::cur);

        if (!parsed.type().is_valid()) {
            warn(start_pos, "invalid_type",
                 build_error_msg("Chunk '", parsed.type(), "' at offset ", start_pos,
                                 " does not have a valid chunk type"));
        }

        m_current = chunk_info{std::move(parsed), start_pos, m_count++};
        return true;
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngstash
