//
// Created by igor on 14/08/2025.
//

#include <pngstash/exceptions.hh>
#include <ostream>

namespace pngstash {

    const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_signature:
                return "invalid_signature";
            case error_kind::truncated_frame:
                return "truncated_frame";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::invalid_chunk_type_chars:
                return "invalid_chunk_type_chars";
            case error_kind::not_text_representable:
                return "not_text_representable";
            case error_kind::utf8_decode_error:
                return "utf8_decode_error";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
            case error_kind::trailing_bytes:
                return "trailing_bytes";
            case error_kind::chunk_too_large:
                return "chunk_too_large";
            case error_kind::io:
                return "io";
        }
        // make compiler happy
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, error_kind kind) {
        return os << to_string(kind);
    }
}
