#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace rangefetch {

struct ThroughputSnapshot {
    std::deque<std::uint64_t> recent_windows;   // closed windows, oldest first
    std::uint64_t bytes_in_current_window{0};
    std::uint64_t total_bytes{0};

    // Mean of the closed windows in bytes per window, 0 when none closed yet.
    [[nodiscard]] std::uint64_t average() const;
};

/// Byte counters shared by every range worker.
///
/// Windows are closed opportunistically: a record() call that observes at
/// least kWindowLength since the window opened pushes the accumulated count
/// into the history and starts the next window with its own bytes. There is no timer, so under
/// sparse traffic a window can last longer than kWindowLength.
class ThroughputAggregator {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    static constexpr std::size_t kWindowCapacity = 10;
    static constexpr Clock::duration kWindowLength = std::chrono::seconds(1);

    // The first window opens here and nowhere else.
    explicit ThroughputAggregator(NowFunction now = &Clock::now);

    ThroughputAggregator(const ThroughputAggregator&) = delete;
    ThroughputAggregator& operator=(const ThroughputAggregator&) = delete;

    void record(std::uint64_t bytes);

    [[nodiscard]] ThroughputSnapshot snapshot() const;

private:
    NowFunction now_;

    mutable std::mutex mutex_;
    std::uint64_t bytes_in_current_window_{0};
    std::deque<std::uint64_t> recent_windows_;
    Clock::time_point window_start_;
    std::uint64_t total_bytes_{0};
};

} // namespace rangefetch
