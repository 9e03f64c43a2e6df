#include "rangefetch/cli.hpp"

#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

#include "rangefetch/errors.hpp"

namespace rangefetch {

CommandLine parseArguments(int argc, const char* const* argv) {
    CommandLine command_line;

    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            command_line.show_help = true;
            return command_line;
        }
    }

    if (argc < 2 || argv[1][0] == '\0') {
        throw ArgumentError("URL is required");
    }
    if (argc > 2) {
        throw ArgumentError(fmt::format("Expected exactly one URL argument, got {}", argc - 1));
    }

    command_line.url = argv[1];
    return command_line;
}

std::string usageText(const std::string& program_name) {
    return fmt::format("Usage: {} <url>\n"
                       "Downloads <url> over one ranged connection per CPU and reports the speed.\n"
                       "Options:\n"
                       "  -h, --help       Show this message\n",
                       program_name);
}

void exitWithFatalError(const std::exception& error) {
    std::cout << std::flush;
    std::cerr << "Fatal error: " << error.what() << std::endl;
    std::_Exit(1);
}

} // namespace rangefetch
