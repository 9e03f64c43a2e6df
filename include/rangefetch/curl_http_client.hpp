#pragma once

#include "http_client.hpp"

#include <memory>
#include <string>

namespace rangefetch {

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "rangefetch/1.0");
    ~CurlHttpClient() override;

    HttpResponse send(const HttpRequest& request, const ChunkHandler& on_chunk) override;

private:
    // Keeps <curl/curl.h> out of the public headers.
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangefetch
