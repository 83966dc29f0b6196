/**
 * @file chunk_extractor.cpp
 * @brief Extract specific chunks from PNG files
 *
 * This example shows how to search for and extract specific chunks
 * from files, saving their payloads as separate files or displaying
 * their contents.
 */

#include <pngstash/parser.hh>
#include <pngstash/exceptions.hh>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <iomanip>
#include <algorithm>
#include <iterator>
#include <map>
#include <sstream>

class ChunkExtractor {
public:
    struct ExtractedChunk {
        pngstash::chunk_type id;
        uint64_t offset;
        pngstash::byte_buffer data;
    };

    void extract(const std::string& filename,
                 const std::string& chunk_id,
                 bool save_to_file = false,
                 bool show_hex = false) {
        pngstash::byte_buffer buffer;
        if (!load(filename, buffer)) {
            return;
        }

        auto target = pngstash::chunk_type::from_text(chunk_id);
        save_to_file_ = save_to_file;
        show_hex_ = show_hex;

        std::cout << "Extracting chunks with ID: '" << chunk_id << "'\n";
        std::cout << "From file: " << filename << "\n";
        std::cout << "=========================================\n\n";

        // Parse options
        pngstash::parse_options options;
        options.strict = false;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning (" << category << ") at 0x" << std::hex << offset << std::dec
                      << ": " << message << "\n";
        };

        // Extract matching chunks
        pngstash::for_each_chunk(buffer, [this, &target](const auto& chunk) {
            if (chunk.value.type() == target) {
                extract_chunk(chunk);
            }
        }, options);

        print_summary();

        // Save extracted chunks if requested
        if (save_to_file_ && !extracted_chunks_.empty()) {
            save_chunks(filename);
        }
    }

    void extract_all(const std::string& filename) {
        pngstash::byte_buffer buffer;
        if (!load(filename, buffer)) {
            return;
        }

        std::cout << "Extracting all chunks from: " << filename << "\n";
        std::cout << "=========================================\n\n";

        pngstash::parse_options options;
        options.strict = false;

        pngstash::for_each_chunk(buffer, [this](const auto& chunk) {
            extract_chunk(chunk);
        }, options);

        print_summary();

        // Group by chunk type
        std::map<pngstash::chunk_type, std::vector<ExtractedChunk*>> by_type;
        for (auto& chunk : extracted_chunks_) {
            by_type[chunk.id].push_back(&chunk);
        }

        std::cout << "\nChunks by Type:\n";
        std::cout << "---------------\n";
        for (const auto& [type, chunks] : by_type) {
            uint64_t total_size = 0;
            for (const auto* chunk : chunks) {
                total_size += chunk->data.size();
            }
            std::cout << "  " << type << ": " << chunks.size() << " chunk(s), "
                      << format_size(total_size) << " total\n";
        }
    }

private:
    static bool load(const std::string& filename, pngstash::byte_buffer& buffer) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return false;
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        buffer.resize(raw.size());
        std::transform(raw.begin(), raw.end(), buffer.begin(), [](char c) { return std::byte(c); });
        return true;
    }

    void extract_chunk(const pngstash::chunk_iterator::chunk_info& chunk_info) {
        extracted_chunks_.push_back({chunk_info.value.type(), chunk_info.file_offset, chunk_info.value.payload()});
        display_chunk(extracted_chunks_.back());
    }

    void display_chunk(const ExtractedChunk& chunk) {
        std::cout << "Found: " << chunk.id << "\n";
        std::cout << "  Offset: 0x" << std::hex << chunk.offset << std::dec << "\n";
        std::cout << "  Size: " << chunk.data.size() << " bytes\n";

        if (show_hex_ && !chunk.data.empty()) {
            std::cout << "  Data (first 256 bytes):\n";
            display_hex_dump(chunk.data.data(), std::min<size_t>(256, chunk.data.size()));
        }

        // Try to interpret as text if it is UTF-8
        if (!chunk.data.empty() &&
            pngstash::find_invalid_utf8(chunk.data.data(), chunk.data.size()) == chunk.data.size()) {
            std::cout << "  Content (text):\n    \"";
            for (size_t i = 0; i < std::min<size_t>(200, chunk.data.size()); ++i) {
                char c = static_cast<char>(chunk.data[i]);
                if (c == '\n') {
                    std::cout << "\\n";
                } else if (c == '\t') {
                    std::cout << "\\t";
                } else {
                    std::cout << c;
                }
            }
            if (chunk.data.size() > 200) {
                std::cout << "...";
            }
            std::cout << "\"\n";
        }

        std::cout << "\n";
    }

    void display_hex_dump(const std::byte* data, size_t size) {
        const size_t bytes_per_line = 16;

        for (size_t offset = 0; offset < size; offset += bytes_per_line) {
            // Offset
            std::cout << "    " << std::hex << std::setw(8)
                      << std::setfill('0') << offset << "  ";

            // Hex bytes
            for (size_t i = 0; i < bytes_per_line; ++i) {
                if (offset + i < size) {
                    std::cout << std::hex << std::setw(2)
                              << std::setfill('0')
                              << std::to_integer<int>(data[offset + i]) << " ";
                } else {
                    std::cout << "   ";
                }

                if (i == 7) std::cout << " ";
            }

            std::cout << " |";

            // ASCII representation
            for (size_t i = 0; i < bytes_per_line && offset + i < size; ++i) {
                char c = static_cast<char>(data[offset + i]);
                if (c >= 32 && c <= 126) {
                    std::cout << c;
                } else {
                    std::cout << ".";
                }
            }

            std::cout << "|\n";
        }
        std::cout << std::dec << std::setfill(' ');
    }

    void save_chunks(const std::string& source_filename) {
        size_t last_slash = source_filename.find_last_of("/\\");
        size_t last_dot = source_filename.find_last_of(".");
        size_t start = last_slash == std::string::npos ? 0 : last_slash + 1;
        size_t end = (last_dot != std::string::npos && last_dot > start) ? last_dot : source_filename.size();
        std::string base_name = source_filename.substr(start, end - start);

        std::cout << "Saving extracted chunks...\n";

        int index = 0;
        for (const auto& chunk : extracted_chunks_) {
            std::ostringstream filename;
            filename << base_name << "_"
                     << chunk.id << "_"
                     << std::setw(3) << std::setfill('0') << index
                     << ".chunk";

            std::ofstream out(filename.str(), std::ios::binary);
            if (out) {
                out.write(reinterpret_cast<const char*>(chunk.data.data()),
                          static_cast<std::streamsize>(chunk.data.size()));
                std::cout << "  Saved: " << filename.str()
                          << " (" << chunk.data.size() << " bytes)\n";
            } else {
                std::cerr << "  Failed to save: " << filename.str() << "\n";
            }

            index++;
        }
    }

    void print_summary() {
        std::cout << "Summary:\n";
        std::cout << "--------\n";
        std::cout << "  Chunks extracted: " << extracted_chunks_.size() << "\n";

        if (!extracted_chunks_.empty()) {
            uint64_t total_size = 0;
            for (const auto& chunk : extracted_chunks_) {
                total_size += chunk.data.size();
            }
            std::cout << "  Total data size: " << format_size(total_size) << "\n";
        }
    }

    std::string format_size(uint64_t size) {
        if (size < 1024) {
            return std::to_string(size) + " bytes";
        } else if (size < 1024 * 1024) {
            return std::to_string(size / 1024) + " KB";
        } else {
            return std::to_string(size / (1024 * 1024)) + " MB";
        }
    }

    bool save_to_file_ = false;
    bool show_hex_ = false;
    std::vector<ExtractedChunk> extracted_chunks_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file> [chunk_type] [options]\n";
        std::cout << "\n";
        std::cout << "Extract chunks from PNG files.\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv[0] << " image.png tEXt\n";
        std::cout << "    Extract all 'tEXt' chunks\n";
        std::cout << "\n";
        std::cout << "  " << argv[0] << " image.png ruSt --hex\n";
        std::cout << "    Extract ruSt chunks and show hex dump\n";
        std::cout << "\n";
        std::cout << "  " << argv[0] << " image.png\n";
        std::cout << "    Extract all chunks (summary only)\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --hex     Show hex dump of chunk data\n";
        std::cout << "  --save    Save chunk payloads to separate files\n";
        return 1;
    }

    ChunkExtractor extractor;

    try {
        if (argc == 2) {
            extractor.extract_all(argv[1]);
        } else {
            bool save = false;
            bool hex = false;

            for (int i = 3; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "--save") {
                    save = true;
                } else if (arg == "--hex") {
                    hex = true;
                }
            }

            extractor.extract(argv[1], argv[2], save, hex);
        }
    } catch (const pngstash::pngstash_error& e) {
        std::cerr << "Error (" << e.kind() << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
