#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch {

struct ByteRange {
    std::uint64_t start{0};
    std::optional<std::uint64_t> end{};   // inclusive; empty means "to end of resource"

    [[nodiscard]] bool isBounded() const { return end.has_value(); }

    // Number of bytes covered, only known for bounded ranges.
    [[nodiscard]] std::optional<std::uint64_t> size() const;

    // Value for the Range request header, e.g. "bytes=0-99" or "bytes=100-".
    [[nodiscard]] std::string headerValue() const;
};

bool operator==(const ByteRange& lhs, const ByteRange& rhs);

/// Split [0, content_length - 1] into contiguous ranges, one per worker.
///
/// Every range but the last spans floor(content_length / worker_count) bytes;
/// the last one is left open ended and absorbs the remainder.
/// When content_length < worker_count the worker count is reduced to
/// content_length so that no range is empty. A zero length yields no ranges.
///
/// @throws std::invalid_argument if worker_count is zero.
std::vector<ByteRange> partitionRanges(std::uint64_t content_length, std::size_t worker_count);

} // namespace rangefetch
