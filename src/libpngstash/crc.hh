//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngstash/chunk_type.hh>

namespace pngstash {

    // CRC-32/ISO-HDLC (the zlib / PNG polynomial), continuing from crc.
    // Start with crc = 0.
    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    // CRC of a chunk: computed over the type bytes followed by the payload
    std::uint32_t chunk_crc(const chunk_type& type, const void* payload, std::size_t size);
}
