#include "rangefetch/report_format.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace rangefetch {

std::string formatStatusLine(const std::tm& local_time, std::uint64_t bytes_per_second) {
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] Average speed: {} B/s, {} KB/s, {} MB/s",
                       local_time,
                       bytes_per_second,
                       bytes_per_second / kBytesPerKilobyte,
                       bytes_per_second / kBytesPerMegabyte);
}

std::string formatSummaryLine(std::uint64_t total_bytes, std::uint64_t bytes_per_second) {
    return fmt::format("Download completed: {} bytes downloaded at an average speed of {} B/s, {} KB/s, {} MB/s",
                       total_bytes,
                       bytes_per_second,
                       bytes_per_second / kBytesPerKilobyte,
                       bytes_per_second / kBytesPerMegabyte);
}

std::tm currentLocalTime() {
    return fmt::localtime(std::time(nullptr));
}

} // namespace rangefetch
