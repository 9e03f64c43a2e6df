#include "rangefetch/curl_http_client.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/detail/header_parser.hpp"
#include "rangefetch/errors.hpp"

namespace rangefetch {

class CurlHttpClient::Impl {
public:
    // Product token followed by the linked libcurl and TLS backend versions.
    explicit Impl(const std::string& product)
        : user_agent_(fmt::format("{} {}", product, detail::curlVersion())) {}

    HttpResponse send(const HttpRequest& request, const ChunkHandler& on_chunk) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderSlist = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransferError("Failed to allocate curl handle");
        }

        HeaderSlist header_list{nullptr, &curl_slist_free_all};
        for (const auto& [name, value] : request.headers) {
            const std::string line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended) {
                throw TransferError("Failed to build request headers");
            }
            header_list.release();
            header_list.reset(appended);
        }

        RequestContext ctx{&on_chunk};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        if (request.method == "HEAD") {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        } else if (request.method != "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && ctx.stopped_by_handler)) {
            throw TransferError(fmt::format("{} {}: curl error: {}", request.method, request.url,
                                            curl_easy_strerror(res)));
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        ctx.response.status = code;
        return std::move(ctx.response);
    }

private:
    struct RequestContext {
        const ChunkHandler* on_chunk{nullptr};
        HttpResponse response{};
        bool stopped_by_handler{false};
        std::exception_ptr failure{};
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        const size_t total = size * nitems;
        detail::applyHeaderLine(std::string(buffer, total), ctx->response);
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        const size_t total = size * nmemb;
        if (total == 0 || !ctx->on_chunk || !*ctx->on_chunk) {
            return total;
        }

        try {
            if (!(*ctx->on_chunk)(ptr, total)) {
                ctx->stopped_by_handler = true;
                return 0;
            }
        } catch (...) {
            // Rethrown from send() once curl has unwound.
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    std::string user_agent_;
};

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : impl_(std::make_unique<Impl>(user_agent)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::send(const HttpRequest& request, const ChunkHandler& on_chunk) {
    return impl_->send(request, on_chunk);
}

} // namespace rangefetch
