/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngstash usage
 *
 * This is a minimal example showing how to parse a PNG file
 * and print information about its chunks.
 */

#include <pngstash/parser.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    pngstash::byte_buffer buffer(raw.size());
    std::transform(raw.begin(), raw.end(), buffer.begin(), [](char c) { return std::byte(c); });

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        // Parse the file and print each chunk
        pngstash::for_each_chunk(buffer, [](const auto& chunk) {
            std::cout << "Chunk: " << chunk.value.type()
                      << " (" << chunk.value.length() << " bytes)\n";

            if (!chunk.value.type().is_critical()) {
                std::cout << "  Ancillary\n";
            }
        });

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
