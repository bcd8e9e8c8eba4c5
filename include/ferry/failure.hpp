// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <variant>

namespace ferry {

// Per-user submission window exhausted
struct RateLimited {
    std::chrono::duration<double> retry_after{0.0};
};

// Global backlog or per-user in-flight cap reached
struct Busy {
    std::uint64_t position{1};
};

// Remote file exceeds the caller's hard cap
struct TooLarge {
    std::uint64_t size{0};
    std::uint64_t limit{0};
};

// Retries exhausted, or a non-retryable local error
struct TransferFailed {
    std::error_code code;
    std::string detail;
};

using Failure = std::variant<RateLimited, Busy, TooLarge, TransferFailed>;

[[nodiscard]] RateLimited rate_limited(double retry_after_seconds) noexcept;
[[nodiscard]] Busy busy(std::int64_t position) noexcept;

[[nodiscard]] std::error_code to_error_code(const Failure& failure) noexcept;

// Generic text safe to show an end user. Never contains internal detail.
[[nodiscard]] std::string user_message(const Failure& failure);

// Full description for logs
[[nodiscard]] std::string describe(const Failure& failure);

} // namespace ferry
