#include "rangefetch/detail/header_parser.hpp"

namespace rangefetch::detail {

std::string trimHeaderText(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void applyHeaderLine(const std::string& line, HttpResponse& response) {
    // Redirects and 100 Continue each bring their own status line.
    if (line.rfind("HTTP/", 0) == 0) {
        response.headers.clear();
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    response.headers.emplace_back(trimHeaderText(line.substr(0, colon)),
                                  trimHeaderText(line.substr(colon + 1)));
}

} // namespace rangefetch::detail
