#include "rangefetch/speed_reporter.hpp"

#include <stdexcept>
#include <utility>

#include "rangefetch/report_format.hpp"

namespace rangefetch {

SpeedReporter::SpeedReporter(std::shared_ptr<const ThroughputAggregator> aggregator,
                             std::chrono::milliseconds interval,
                             std::ostream& out)
    : aggregator_(std::move(aggregator)),
      interval_(interval),
      out_(out) {}

SpeedReporter::~SpeedReporter() { stop(); }

void SpeedReporter::start() {
    if (thread_.joinable()) {
        throw std::logic_error("SpeedReporter already started");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&SpeedReporter::run, this);
}

void SpeedReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        running_ = false;
    }
    wakeup_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool SpeedReporter::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SpeedReporter::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (wakeup_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            return;
        }

        lock.unlock();
        tick();
        lock.lock();
    }
}

void SpeedReporter::tick() {
    const auto snapshot = aggregator_->snapshot();
    out_ << formatStatusLine(currentLocalTime(), snapshot.average()) << std::endl;
}

} // namespace rangefetch
