//
// Created by igor on 16/08/2025.
//

#include "commands.hh"

#include <fstream>
#include <iostream>
#include <string_view>

#include <pngstash/exceptions.hh>
#include <pngstash/parser.hh>
#include <pngstash/png.hh>

namespace pngstash::cli {

    namespace {
        const char* yes_no(bool value, const char* yes, const char* no) {
            return value ? yes : no;
        }

        // Payload as text, or its size when it is not UTF-8
        std::string describe_payload(const chunk& c) {
            if (find_invalid_utf8(c.payload().data(), c.payload().size()) != c.payload().size()) {
                return "<" + std::to_string(c.payload().size()) + " bytes>";
            }
            return c.payload_as_text();
        }

        struct command_line {
            std::string command;
            std::vector<std::string> positional;
            std::optional<std::filesystem::path> output;
            bool lenient = false;
            bool help = false;
        };

        // Returns false on a malformed option
        bool split_arguments(const std::vector<std::string>& args, command_line& cmd, std::ostream& err) {
            cmd.command = args[0];
            for (std::size_t i = 1; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (arg == "-o" || arg == "--output") {
                    if (i + 1 >= args.size()) {
                        err << "Option " << arg << " requires a path\n";
                        return false;
                    }
                    cmd.output = args[++i];
                } else if (arg == "--lenient") {
                    cmd.lenient = true;
                } else if (arg == "-h" || arg == "--help") {
                    cmd.help = true;
                } else if (arg.size() > 1 && arg[0] == '-') {
                    err << "Unknown option: " << arg << "\n";
                    return false;
                } else {
                    cmd.positional.push_back(arg);
                }
            }
            return true;
        }

        bool check_arity(const command_line& cmd, std::size_t expected, bool allows_output, std::ostream& err) {
            if (cmd.positional.size() != expected) {
                err << "Command '" << cmd.command << "' expects " << expected
                    << " argument(s), got " << cmd.positional.size() << "\n";
                return false;
            }
            if (cmd.output && !allows_output) {
                err << "Command '" << cmd.command << "' does not write a file\n";
                return false;
            }
            return true;
        }
    }

    byte_buffer read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_IF(!file, "Failed to open file: ", path.string());

        // Get file size
        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of file: ", path.string());
        file.seekg(0, std::ios::beg);

        // Read file
        byte_buffer data(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                    "Failed to read file: ", path.string());
        return data;
    }

    void write_file(const std::filesystem::path& path, const byte_buffer& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Failed to open file for writing: ", path.string());

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        THROW_IO_IF(!file, "Failed to write file: ", path.string());
    }

    void encode(const encode_args& args, const parse_options& options, std::ostream& out) {
        auto type = chunk_type::from_text(args.chunk_type);
        auto image = png::parse(read_file(args.png_path), options);

        image.append_chunk(chunk(type, args.message));

        auto target = args.output.value_or(args.png_path);
        write_file(target, image.serialize());
        out << "Encoded " << args.message.size() << " byte message into chunk '" << type
            << "' of " << target.string() << "\n";
    }

    void decode(const decode_args& args, const parse_options& options, std::ostream& out) {
        auto type = chunk_type::from_text(args.chunk_type);
        auto image = png::parse(read_file(args.png_path), options);

        const chunk* found = image.find_chunk(type);
        if (!found) {
            THROW_LOOKUP("No chunk of type '", type, "' found in ", args.png_path.string());
        }
        out << found->payload_as_text() << "\n";
    }

    void remove(const remove_args& args, const parse_options& options, std::ostream& out) {
        auto image = png::parse(read_file(args.png_path), options);
        auto removed = image.remove_chunk(args.chunk_type);

        auto target = args.output.value_or(args.png_path);
        write_file(target, image.serialize());
        out << "Removed chunk '" << removed.type() << "': " << describe_payload(removed) << "\n";
    }

    void print(const print_args& args, const parse_options& options, std::ostream& out) {
        auto buffer = read_file(args.png_path);

        out << "File: " << args.png_path.string() << " (" << buffer.size() << " bytes)\n";
        std::size_t count = 0;
        for_each_chunk(buffer, [&out, &count](const chunk_iterator::chunk_info& info) {
            const auto& type = info.value.type();
            out << "\n#" << info.index << " at offset " << info.file_offset << "\n";
            out << info.value;
            out << "Flags: "
                << yes_no(type.is_critical(), "critical", "ancillary") << ", "
                << yes_no(type.is_public(), "public", "private") << ", "
                << yes_no(type.is_safe_to_copy(), "safe-to-copy", "unsafe-to-copy")
                << yes_no(type.is_valid(), "", ", invalid type") << "\n";
            count++;
        }, options);
        out << "\n" << count << " chunk(s)\n";
    }

    void print_usage(const std::string& program, std::ostream& os) {
        os << "Usage: " << program << " <command> [arguments] [options]\n";
        os << "\n";
        os << "Hide messages in PNG files as custom chunks.\n";
        os << "\n";
        os << "Commands:\n";
        os << "  encode <file> <type> <message>   Append a chunk holding message\n";
        os << "  decode <file> <type>             Print the message of the first chunk of type\n";
        os << "  remove <file> <type>             Remove the first chunk of type\n";
        os << "  print  <file>                    List all chunks\n";
        os << "\n";
        os << "Options:\n";
        os << "  -o, --output <path>   Write the result to path instead of <file> (encode, remove)\n";
        os << "  --lenient             Report trailing bytes and oversized chunks as warnings\n";
        os << "  -h, --help            Show this help\n";
    }

    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
        const std::string program = "pngstash";
        if (args.empty()) {
            print_usage(program, err);
            return 2;
        }
        if (args[0] == "-h" || args[0] == "--help") {
            print_usage(program, out);
            return 0;
        }

        command_line cmd;
        if (!split_arguments(args, cmd, err)) {
            print_usage(program, err);
            return 2;
        }
        if (cmd.help) {
            print_usage(program, out);
            return 0;
        }

        parse_options options;
        options.strict = !cmd.lenient;
        options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
            err << "warning: [" << category << "] offset " << offset << ": " << message << "\n";
        };

        try {
            const auto& p = cmd.positional;
            if (cmd.command == "encode") {
                if (!check_arity(cmd, 3, true, err)) {
                    return 2;
                }
                encode({p[0], p[1], p[2], cmd.output}, options, out);
            } else if (cmd.command == "decode") {
                if (!check_arity(cmd, 2, false, err)) {
                    return 2;
                }
                decode({p[0], p[1]}, options, out);
            } else if (cmd.command == "remove") {
                if (!check_arity(cmd, 2, true, err)) {
                    return 2;
                }
                cli::remove({p[0], p[1], cmd.output}, options, out);
            } else if (cmd.command == "print") {
                if (!check_arity(cmd, 1, false, err)) {
                    return 2;
                }
                cli::print({p[0]}, options, out);
            } else {
                err << "Unknown command: " << cmd.command << "\n";
                print_usage(program, err);
                return 2;
            }
        } catch (const pngstash_error& e) {
            err << "error: " << e.kind() << ": " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

} // namespace pngstash::cli
