#pragma once

#include "byte_range.hpp"
#include "http_client.hpp"
#include "throughput_aggregator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rangefetch {

struct DownloaderConfig {
    std::size_t worker_count{1};
    std::chrono::milliseconds report_interval{std::chrono::seconds(1)};

    // One worker per hardware thread, status line every second.
    static DownloaderConfig fromHost();
};

struct DownloadSummary {
    std::uint64_t total_bytes{0};
    std::uint64_t average_bytes_per_second{0};
    std::size_t worker_count{0};
};

/// Strict Content-Length parsing: optional surrounding whitespace, decimal
/// digits only, must fit in 64 bits.
/// @throws SizeUnavailable if the value is missing or malformed.
std::uint64_t parseContentLength(const std::optional<std::string>& value);

/// Fetches one resource over several concurrent range requests.
///
/// All-or-nothing: the first worker failure is rethrown from run() while the
/// remaining workers are left to finish on their own, detached.
class ParallelDownloader {
public:
    ParallelDownloader(std::string url,
                       std::shared_ptr<HttpClient> client,
                       DownloaderConfig config,
                       std::ostream& out = std::cout);

    /// @throws SizeUnavailable, TransferError
    DownloadSummary run();

private:
    std::uint64_t fetchContentLength() const;
    void runWorkers(const std::vector<ByteRange>& ranges,
                    const std::shared_ptr<ThroughputAggregator>& aggregator) const;

    std::string url_;
    std::shared_ptr<HttpClient> client_;
    DownloaderConfig config_;
    std::ostream& out_;
};

} // namespace rangefetch
