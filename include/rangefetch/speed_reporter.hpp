#pragma once

#include "throughput_aggregator.hpp"

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

namespace rangefetch {

/// Prints the smoothed download speed once per interval on its own thread.
/// Only reads the aggregator, through snapshot().
class SpeedReporter {
public:
    SpeedReporter(std::shared_ptr<const ThroughputAggregator> aggregator,
                  std::chrono::milliseconds interval,
                  std::ostream& out = std::cout);
    ~SpeedReporter();

    SpeedReporter(const SpeedReporter&) = delete;
    SpeedReporter& operator=(const SpeedReporter&) = delete;

    void start();

    // Waits for a tick in progress to finish. Safe to call more than once.
    void stop();

    [[nodiscard]] bool isRunning() const;

private:
    void run();
    void tick();

    std::shared_ptr<const ThroughputAggregator> aggregator_;
    std::chrono::milliseconds interval_;
    std::ostream& out_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    bool stop_requested_{false};
    bool running_{false};   // guarded by mutex_, unlike thread_
    std::thread thread_;
};

} // namespace rangefetch
