/**
 * @file main.cpp
 * @brief pngstash command line tool
 *
 * Hides, reveals and removes text messages stored as custom chunks
 * inside PNG files.
 */

#include <iostream>
#include <string>
#include <vector>

#include "commands.hh"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return pngstash::cli::run(args, std::cout, std::cerr);
}
