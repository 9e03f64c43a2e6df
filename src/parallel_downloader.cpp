#include "rangefetch/parallel_downloader.hpp"

#include <algorithm>
#include <charconv>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "rangefetch/errors.hpp"
#include "rangefetch/range_worker.hpp"
#include "rangefetch/report_format.hpp"
#include "rangefetch/speed_reporter.hpp"

namespace rangefetch {

namespace {

// Completion board shared with the worker threads. It outlives run() when
// workers are abandoned, hence the shared ownership.
class WorkerBoard {
public:
    void finish(std::exception_ptr failure) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++finished_;
            if (failure && !failure_) {
                failure_ = std::move(failure);
            }
        }
        changed_.notify_all();
    }

    // Returns the first failure, or null once every worker has succeeded.
    std::exception_ptr wait(std::size_t worker_count) {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [&] { return failure_ || finished_ == worker_count; });
        return failure_;
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    std::size_t finished_{0};
    std::exception_ptr failure_{};
};

void abandonWorkers(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
    threads.clear();
}

} // namespace

DownloaderConfig DownloaderConfig::fromHost() {
    DownloaderConfig config;
    config.worker_count = std::max(1u, std::thread::hardware_concurrency());
    return config;
}

std::uint64_t parseContentLength(const std::optional<std::string>& value) {
    if (!value) {
        throw SizeUnavailable("Server did not report a Content-Length");
    }

    const auto first = value->find_first_not_of(" \t");
    const auto last = value->find_last_not_of(" \t");
    if (first == std::string::npos) {
        throw SizeUnavailable("Server reported an empty Content-Length");
    }

    const char* begin = value->data() + first;
    const char* end = value->data() + last + 1;
    std::uint64_t length = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc{} || ptr != end) {
        throw SizeUnavailable(fmt::format("Invalid Content-Length: '{}'", *value));
    }
    return length;
}

ParallelDownloader::ParallelDownloader(std::string url,
                                       std::shared_ptr<HttpClient> client,
                                       DownloaderConfig config,
                                       std::ostream& out)
    : url_(std::move(url)),
      client_(std::move(client)),
      config_(config),
      out_(out) {}

DownloadSummary ParallelDownloader::run() {
    const std::uint64_t content_length = fetchContentLength();
    const auto ranges = partitionRanges(content_length, config_.worker_count);

    auto aggregator = std::make_shared<ThroughputAggregator>();

    SpeedReporter reporter(aggregator, config_.report_interval, out_);
    reporter.start();

    runWorkers(ranges, aggregator);

    reporter.stop();

    const auto snapshot = aggregator->snapshot();
    DownloadSummary summary;
    summary.total_bytes = snapshot.total_bytes;
    summary.average_bytes_per_second = snapshot.average();
    summary.worker_count = ranges.size();

    out_ << formatSummaryLine(summary.total_bytes, summary.average_bytes_per_second) << std::endl;
    return summary;
}

std::uint64_t ParallelDownloader::fetchContentLength() const {
    HttpRequest request;
    request.method = "GET";
    request.url = url_;

    // Only the headers matter; the body is abandoned at the first chunk.
    const HttpResponse response = client_->send(request, [](const char*, std::size_t) { return false; });
    if (response.status < 200 || response.status > 299) {
        throw TransferError(fmt::format("{}: unexpected HTTP status {}", url_, response.status));
    }

    return parseContentLength(response.header("Content-Length"));
}

void ParallelDownloader::runWorkers(const std::vector<ByteRange>& ranges,
                                    const std::shared_ptr<ThroughputAggregator>& aggregator) const {
    auto board = std::make_shared<WorkerBoard>();

    std::vector<std::thread> threads;
    threads.reserve(ranges.size());
    try {
        for (const auto& range : ranges) {
            threads.emplace_back([worker = RangeWorker(url_, range, client_, aggregator), board]() mutable {
                std::exception_ptr failure;
                try {
                    worker.run();
                } catch (...) {
                    failure = std::current_exception();
                }
                board->finish(std::move(failure));
            });
        }
    } catch (...) {
        abandonWorkers(threads);
        throw;
    }

    if (auto failure = board->wait(threads.size())) {
        abandonWorkers(threads);
        std::rethrow_exception(failure);
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

} // namespace rangefetch
