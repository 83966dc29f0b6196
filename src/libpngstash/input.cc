//
// Created by igor on 12/08/2025.
//

#include <algorithm>

#include "input.hh"

namespace pngstash {
    // byte_reader implementation
    byte_reader::byte_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_PARSE_IF(!m_data && size > 0, truncated_frame, "Null buffer of size ", size);
    }

    std::size_t byte_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        // Check how much we can read within our region
        std::size_t available = remaining();
        if (available == 0) {
            return 0;  // EOF-like behavior
        }

        size = std::min(size, available);
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void byte_reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos = 0;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                THROW_PARSE_IF(offset > m_size, truncated_frame,
                               "Cannot seek ", offset, " bytes before end of ", m_size, " byte buffer");
                new_pos = m_size - offset;
                break;
        }

        THROW_PARSE_IF(new_pos > m_size, truncated_frame,
                       "Cannot seek to offset ", new_pos, " - buffer size is only ", m_size, " bytes");

        m_position = static_cast<std::size_t>(new_pos);
    }

    byte_buffer byte_reader::read_exact(std::size_t size) {
        THROW_PARSE_IF(size > remaining(), truncated_frame,
                       "Unexpected end of data at offset ", m_position,
                       ": requested ", size, " bytes, only ", remaining(), " left");
        byte_buffer buffer(size);
        read(buffer.data(), size);
        return buffer;
    }

    chunk_type byte_reader::read_chunk_type() {
        std::array<std::uint8_t, 4> data{};
        std::size_t actual = read(data.data(), 4);
        THROW_PARSE_IF(actual != 4, truncated_frame,
                       "Failed to read chunk type at offset ", m_position);
        return chunk_type::from_bytes(data);
    }

    // byte_writer implementation
    void byte_writer::write(const void* src, std::size_t size) {
        auto first = static_cast<const std::byte*>(src);
        m_out.insert(m_out.end(), first, first + size);
    }

    void byte_writer::write_chunk_type(const chunk_type& type) {
        write(type.bytes().data(), type.bytes().size());
    }
}
