//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <cstring>

#include <pngstash/exceptions.hh>
#include <pngstash/byte_order.hh>
#include <pngstash/chunk.hh>
#include <pngstash/chunk_type.hh>

namespace pngstash {

    // Bounds checked reader over a memory region it does not own.
    // Short reads throw truncated_frame.
    class byte_reader {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            byte_reader(const void* data, std::size_t size);

            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);
            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Pointer to the byte at the current position
            [[nodiscard]] const std::byte* position_ptr() const { return m_data + m_position; }

            // Convenience methods
            byte_buffer read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_PARSE_IF(actual != sizeof(T), truncated_frame,
                               "Unexpected end of data at offset ", m_position,
                               ": needed ", sizeof(T), " bytes, got ", actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            // Same as read<T> without moving the position
            template<typename T>
            T peek(byte_order bo) {
                auto saved = m_position;
                T value = read<T>(bo);
                m_position = saved;
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Appends encoded values to a byte_buffer
    class byte_writer {
        public:
            explicit byte_writer(byte_buffer& out) : m_out(out) {}

            void write(const void* src, std::size_t size);

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_chunk_type(const chunk_type& type);

        private:
            byte_buffer& m_out;
    };
}
