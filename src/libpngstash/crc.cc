//
// Created by igor on 15/08/2025.
//

#include <zlib.h>

#include "crc.hh"

namespace pngstash {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        if (size == 0) {
            return crc;
        }
        return static_cast<std::uint32_t>(
            ::crc32_z(crc, static_cast<const Bytef*>(data), static_cast<z_size_t>(size)));
    }

    std::uint32_t chunk_crc(const chunk_type& type, const void* payload, std::size_t size) {
        std::uint32_t crc = crc32_update(0, type.bytes().data(), type.bytes().size());
        return crc32_update(crc, payload, size);
    }
}
