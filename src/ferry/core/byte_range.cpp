// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/byte_range.hpp>
#include <algorithm>

namespace ferry::core {

std::uint64_t part_size(std::uint64_t total,
                        std::uint64_t threshold,
                        std::uint32_t max_workers) noexcept {
    std::uint64_t fanout = 2ull * std::max<std::uint32_t>(1, max_workers);
    std::uint64_t even = (total + fanout - 1) / fanout;
    return std::max<std::uint64_t>({threshold, even, 1});
}

std::vector<ByteRange> split_ranges(std::uint64_t total,
                                    std::uint64_t threshold,
                                    std::uint32_t max_workers) {
    std::vector<ByteRange> ranges;
    if (total == 0) return ranges;

    std::uint64_t part = part_size(total, threshold, max_workers);
    ranges.reserve(static_cast<std::size_t>((total + part - 1) / part));

    for (std::uint64_t start = 0; start < total; start += part) {
        std::uint64_t end = std::min(total, start + part) - 1;
        ranges.push_back({start, end});
    }
    return ranges;
}

} // namespace ferry::core
