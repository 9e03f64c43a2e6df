#pragma once

#include "byte_range.hpp"
#include "http_client.hpp"
#include "throughput_aggregator.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rangefetch {

/// Streams one byte range of the resource and feeds every chunk length to
/// the shared aggregator. A worker runs once; it has no retry and no timeout.
class RangeWorker {
public:
    RangeWorker(std::string url,
                ByteRange range,
                std::shared_ptr<HttpClient> client,
                std::shared_ptr<ThroughputAggregator> aggregator);

    /// @throws TransferError on request failure, a non-2xx status, or a body
    ///         whose length does not match a bounded range.
    void run();

    [[nodiscard]] const ByteRange& range() const { return range_; }
    [[nodiscard]] std::uint64_t bytesReceived() const { return bytes_received_; }

private:
    std::string url_;
    ByteRange range_;
    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<ThroughputAggregator> aggregator_;
    std::uint64_t bytes_received_{0};
};

} // namespace rangefetch
