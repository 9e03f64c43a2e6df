#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rangefetch {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    HeaderList headers;
};

struct HttpResponse {
    long status{0};
    HeaderList headers;

    // Case-insensitive lookup, last occurrence wins.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

/// Receives one body chunk. Returning false ends the transfer early; the
/// response is still reported as successful.
using ChunkHandler = std::function<bool(const char* data, std::size_t size)>;

/// Streaming request/response client shared by every worker.
/// Implementations must allow concurrent send() calls.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Performs the request and feeds the body to on_chunk as it arrives.
    /// @throws TransferError when the request cannot be completed.
    virtual HttpResponse send(const HttpRequest& request, const ChunkHandler& on_chunk) = 0;
};

} // namespace rangefetch
