// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <vector>

namespace ferry::core {

// Inclusive byte range [first, last] of a remote resource
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return last - first + 1; }

    friend bool operator==(const ByteRange&, const ByteRange&) = default;
};

// Part size for a multipart transfer: max(threshold, ceil(total / (2 * workers)))
[[nodiscard]] std::uint64_t part_size(std::uint64_t total,
                                      std::uint64_t threshold,
                                      std::uint32_t max_workers) noexcept;

// Split [0, total) into disjoint, ordered ranges that cover it exactly.
// Empty when total is 0.
[[nodiscard]] std::vector<ByteRange> split_ranges(std::uint64_t total,
                                                  std::uint64_t threshold,
                                                  std::uint32_t max_workers);

} // namespace ferry::core
