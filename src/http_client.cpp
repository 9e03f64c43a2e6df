#include "rangefetch/http_client.hpp"

#include <algorithm>
#include <cctype>

namespace rangefetch {

namespace {
bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}
} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (equalsIgnoreCase(it->first, name)) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // namespace rangefetch
