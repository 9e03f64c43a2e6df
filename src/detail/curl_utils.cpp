#include "rangefetch/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <fmt/format.h>

#include "rangefetch/errors.hpp"

namespace rangefetch::detail {

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw TransferError(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(res)));
        }
    }

    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

void ensureCurlInitialized() {
    // A throwing constructor leaves the static uninitialized; the next call retries.
    static CurlGlobal global;
    (void)global;
}

std::string curlVersion() {
    ensureCurlInitialized();
    return curl_version();
}

} // namespace rangefetch::detail
