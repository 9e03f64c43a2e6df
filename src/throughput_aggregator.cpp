#include "rangefetch/throughput_aggregator.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace rangefetch {

std::uint64_t ThroughputSnapshot::average() const {
    const std::uint64_t sum = std::accumulate(recent_windows.begin(), recent_windows.end(), std::uint64_t{0});
    return sum / std::max<std::uint64_t>(recent_windows.size(), 1);
}

ThroughputAggregator::ThroughputAggregator(NowFunction now)
    : now_(std::move(now)),
      window_start_(now_()) {}

void ThroughputAggregator::record(std::uint64_t bytes) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ += bytes;

    // The chunk that observes the boundary opens the next window.
    if (now - window_start_ >= kWindowLength) {
        recent_windows_.push_back(bytes_in_current_window_);
        if (recent_windows_.size() > kWindowCapacity) {
            recent_windows_.pop_front();
        }
        bytes_in_current_window_ = 0;
        window_start_ = now;
    }

    bytes_in_current_window_ += bytes;
}

ThroughputSnapshot ThroughputAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {recent_windows_, bytes_in_current_window_, total_bytes_};
}

} // namespace rangefetch
