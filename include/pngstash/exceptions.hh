/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngstash library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the error kinds, the exception hierarchy and the
 * convenience macros used for error reporting throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>
#include <pngstash/export_pngstash.h>

namespace pngstash {

    /**
     * @enum error_kind
     * @brief Closed set of failure categories reported by the library
     */
    enum class error_kind {
        invalid_signature,        ///< First 8 bytes are not the PNG signature
        truncated_frame,          ///< Chunk frame is shorter than its header or declared length
        crc_mismatch,             ///< Stored CRC differs from the computed one
        invalid_chunk_type_chars, ///< Chunk type text is not 4 alphabetic characters
        not_text_representable,   ///< Chunk type bytes can not be rendered as text
        utf8_decode_error,        ///< Payload is not well-formed UTF-8
        chunk_not_found,          ///< No chunk with the requested type
        trailing_bytes,           ///< Leftover bytes too short to form a frame
        chunk_too_large,          ///< Declared length exceeds parse_options::max_chunk_size
        io                        ///< File access failed (tool layer)
    };

    /**
     * @brief Stable name of an error kind (e.g. "crc_mismatch")
     */
    PNGSTASH_EXPORT const char* to_string(error_kind kind);

    PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, error_kind kind);

    /**
     * @class pngstash_error
     * @brief Base exception class for all pngstash errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngstash error with a single catch block. The
     * failure category is available through kind().
     */
    class PNGSTASH_EXPORT pngstash_error : public std::runtime_error {
    public:
        pngstash_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input bytes
     *
     * Thrown when the signature is wrong, a frame is truncated, a CRC
     * does not match or bytes are left over after the last frame.
     */
    class PNGSTASH_EXPORT parse_error : public pngstash_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngstash_error(kind, msg) {}
    };

    /**
     * @class crc_mismatch_error
     * @brief parse_error carrying the stored and the computed checksum
     */
    class PNGSTASH_EXPORT crc_mismatch_error : public parse_error {
    public:
        crc_mismatch_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : parse_error(error_kind::crc_mismatch, msg), m_expected(expected), m_actual(actual) {}

        /// CRC stored in the frame
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC computed over type and payload
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class format_error
     * @brief Exception for values that can not be converted
     *
     * Thrown for invalid chunk type text, chunk type bytes that are not
     * text, and payloads that are not valid UTF-8.
     */
    class PNGSTASH_EXPORT format_error : public pngstash_error {
    public:
        format_error(error_kind kind, const std::string& msg)
            : pngstash_error(kind, msg) {}
    };

    /**
     * @class lookup_error
     * @brief Exception for chunks that are not present in a png
     */
    class PNGSTASH_EXPORT lookup_error : public pngstash_error {
    public:
        explicit lookup_error(const std::string& msg)
            : pngstash_error(error_kind::chunk_not_found, msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown by the command line layer when reading or writing files fails.
     */
    class PNGSTASH_EXPORT io_error : public pngstash_error {
    public:
        explicit io_error(const std::string& msg)
            : pngstash_error(error_kind::io, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngstash::parse_error(::pngstash::error_kind::kind, ::pngstash::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT
     * @brief Throw a format_error of the given kind with formatted message
     */
    #define THROW_FORMAT(kind, ...) \
        throw ::pngstash::format_error(::pngstash::error_kind::kind, ::pngstash::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_LOOKUP
     * @brief Throw a lookup_error with formatted message
     */
    #define THROW_LOOKUP(...) \
        throw ::pngstash::lookup_error(::pngstash::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngstash::io_error(::pngstash::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_FORMAT_UNLESS
     * @brief Throw a format_error unless condition is true
     */
    #define THROW_FORMAT_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_FORMAT(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngstash
