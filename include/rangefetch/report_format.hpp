#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace rangefetch {

constexpr std::uint64_t kBytesPerKilobyte = 1024;
constexpr std::uint64_t kBytesPerMegabyte = 1024 * 1024;

// "[2024-01-31 12:00:00] Average speed: 2097152 B/s, 2048 KB/s, 2 MB/s"
std::string formatStatusLine(const std::tm& local_time, std::uint64_t bytes_per_second);

std::string formatSummaryLine(std::uint64_t total_bytes, std::uint64_t bytes_per_second);

std::tm currentLocalTime();

} // namespace rangefetch
