/**
 * @file parser.hh
 * @brief Streaming access to the chunks of a PNG buffer
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <pngstash/chunk_iterator.hh>
#include <pngstash/parse_options.hh>

namespace pngstash {

    /**
     * @brief Simple functional interface for iterating chunks with custom options
     *
     * Calls the provided function for each chunk in the buffer without
     * building a png. Chunks handed to func before a failing frame stay
     * delivered; the error is thrown after them.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param buffer Buffer containing PNG data
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const byte_buffer& buffer, Func func, const parse_options& options) {
        chunk_iterator it(buffer, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    /**
     * @brief Simple functional interface for iterating chunks
     *
     * Uses default parse options.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param buffer Buffer containing PNG data
     * @param func Function to call for each chunk
     */
    template<typename Func>
    void for_each_chunk(const byte_buffer& buffer, Func func) {
        for_each_chunk(buffer, func, parse_options{});
    }

} // namespace pngstash
