#pragma once

#include "rangefetch/http_client.hpp"

#include <string>

namespace rangefetch::detail {

// Strips leading and trailing spaces, tabs and CR/LF.
std::string trimHeaderText(const std::string& value);

/// Applies one raw header line, as delivered by the transport, to response.
/// A status line ("HTTP/1.1 302 Found") starts a new response and clears the
/// headers collected so far; lines without a colon are ignored.
void applyHeaderLine(const std::string& line, HttpResponse& response);

} // namespace rangefetch::detail
