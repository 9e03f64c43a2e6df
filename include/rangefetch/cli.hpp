#pragma once

#include <exception>
#include <string>

namespace rangefetch {

struct CommandLine {
    std::string url;
    bool show_help{false};
};

/// Accepts exactly one positional URL, or -h/--help in its place.
/// @throws ArgumentError when the URL is missing or extra arguments follow.
CommandLine parseArguments(int argc, const char* const* argv);

std::string usageText(const std::string& program_name);

/// Prints "Fatal error: <what>" and terminates with status 1 through
/// std::_Exit. Range workers abandoned by a failed download may still be
/// inside libcurl, so neither atexit handlers nor static destructors (which
/// own curl_global_cleanup) may run.
[[noreturn]] void exitWithFatalError(const std::exception& error);

} // namespace rangefetch
