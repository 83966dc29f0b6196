/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngstash {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, bytes left over after the last frame and chunks
         * above max_chunk_size are errors. When false, they are reported
         * through on_warning and parsing goes on.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is 2^31 - 1, the largest length PNG allows.
         */
        std::uint64_t max_chunk_size = (std::uint64_t(1) << 31) - 1;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category (e.g., "size_limit", "invalid_type")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngstash
