#include "rangefetch/range_worker.hpp"

#include <utility>

#include <fmt/format.h>

#include "rangefetch/errors.hpp"

namespace rangefetch {

RangeWorker::RangeWorker(std::string url,
                         ByteRange range,
                         std::shared_ptr<HttpClient> client,
                         std::shared_ptr<ThroughputAggregator> aggregator)
    : url_(std::move(url)),
      range_(range),
      client_(std::move(client)),
      aggregator_(std::move(aggregator)) {}

void RangeWorker::run() {
    HttpRequest request;
    request.method = "GET";
    request.url = url_;
    request.headers.emplace_back("Range", range_.headerValue());

    bytes_received_ = 0;
    const HttpResponse response = client_->send(request, [this](const char*, std::size_t size) {
        bytes_received_ += size;
        aggregator_->record(size);
        return true;
    });

    if (response.status < 200 || response.status > 299) {
        throw TransferError(fmt::format("{} ({}): unexpected HTTP status {}",
                                        url_, range_.headerValue(), response.status));
    }

    const auto expected = range_.size();
    if (expected && bytes_received_ != *expected) {
        throw TransferError(fmt::format("{} ({}): range download incomplete, received {} of {} bytes",
                                        url_, range_.headerValue(), bytes_received_, *expected));
    }
}

} // namespace rangefetch
