/**
 * @file commands.hh
 * @brief Subcommands of the pngstash command line tool
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <pngstash/chunk.hh>
#include <pngstash/parse_options.hh>

namespace pngstash::cli {

    /**
     * @brief Read a whole file into memory
     * @throws io_error if the file can not be opened or read
     */
    byte_buffer read_file(const std::filesystem::path& path);

    /**
     * @brief Replace the contents of a file
     * @throws io_error if the file can not be written
     */
    void write_file(const std::filesystem::path& path, const byte_buffer& data);

    struct encode_args {
        std::filesystem::path png_path;
        std::string chunk_type;
        std::string message;
        std::optional<std::filesystem::path> output;   ///< Defaults to png_path
    };

    struct decode_args {
        std::filesystem::path png_path;
        std::string chunk_type;
    };

    struct remove_args {
        std::filesystem::path png_path;
        std::string chunk_type;
        std::optional<std::filesystem::path> output;   ///< Defaults to png_path
    };

    struct print_args {
        std::filesystem::path png_path;
    };

    // Appends a chunk holding the message
    void encode(const encode_args& args, const parse_options& options, std::ostream& out);

    // Prints the payload of the first chunk of the type
    void decode(const decode_args& args, const parse_options& options, std::ostream& out);

    // Removes the first chunk of the type and prints its payload
    void remove(const remove_args& args, const parse_options& options, std::ostream& out);

    // Prints every chunk with its offset and property flags
    void print(const print_args& args, const parse_options& options, std::ostream& out);

    /**
     * @brief Parse the command line and run one subcommand
     * @param args Arguments without the program name
     * @param out Normal output
     * @param err Usage, warnings and errors
     * @return 0 on success, 1 on a failed command, 2 on bad usage
     */
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    void print_usage(const std::string& program, std::ostream& os);

} // namespace pngstash::cli
