#include "rangefetch/byte_range.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace rangefetch {

std::optional<std::uint64_t> ByteRange::size() const {
    if (!end) {
        return std::nullopt;
    }
    return *end - start + 1;
}

std::string ByteRange::headerValue() const {
    if (end) {
        return fmt::format("bytes={}-{}", start, *end);
    }
    return fmt::format("bytes={}-", start);
}

bool operator==(const ByteRange& lhs, const ByteRange& rhs) {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

std::vector<ByteRange> partitionRanges(std::uint64_t content_length, std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }

    std::vector<ByteRange> ranges;
    if (content_length == 0) {
        return ranges;
    }

    const std::uint64_t workers = std::min<std::uint64_t>(worker_count, content_length);
    const std::uint64_t chunk_size = content_length / workers;

    ranges.reserve(static_cast<std::size_t>(workers));
    for (std::uint64_t i = 0; i + 1 < workers; ++i) {
        ranges.push_back({i * chunk_size, (i + 1) * chunk_size - 1});
    }
    ranges.push_back({(workers - 1) * chunk_size, std::nullopt});

    return ranges;
}

} // namespace rangefetch
