// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/failure.hpp>
#include <ferry/core/error.hpp>
#include <ferry/queue/error.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

namespace ferry {

RateLimited rate_limited(double retry_after_seconds) noexcept {
    return RateLimited{std::chrono::duration<double>(std::max(0.0, retry_after_seconds))};
}

Busy busy(std::int64_t position) noexcept {
    return Busy{static_cast<std::uint64_t>(std::max<std::int64_t>(1, position))};
}

std::error_code to_error_code(const Failure& failure) noexcept {
    return std::visit([](const auto& f) -> std::error_code {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, RateLimited>) {
            return queue::make_error_code(queue::QueueErrc::rate_limited);
        } else if constexpr (std::is_same_v<T, Busy>) {
            return queue::make_error_code(queue::QueueErrc::busy);
        } else if constexpr (std::is_same_v<T, TooLarge>) {
            return core::make_error_code(core::DownloadErrc::too_large);
        } else {
            return f.code ? f.code : core::make_error_code(core::DownloadErrc::network_error);
        }
    }, failure);
}

std::string user_message(const Failure& failure) {
    return std::visit([](const auto& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, RateLimited>) {
            auto secs = static_cast<long long>(std::ceil(f.retry_after.count()));
            return std::format("Too many requests. Try again in {} s.", std::max(1LL, secs));
        } else if constexpr (std::is_same_v<T, Busy>) {
            return std::format("The queue is busy. Your position: {}.", f.position);
        } else if constexpr (std::is_same_v<T, TooLarge>) {
            return "The file is too large to send.";
        } else {
            return "Download failed. Please try again later.";
        }
    }, failure);
}

std::string describe(const Failure& failure) {
    return std::visit([](const auto& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, RateLimited>) {
            return std::format("rate limited, retry after {:.1f}s", f.retry_after.count());
        } else if constexpr (std::is_same_v<T, Busy>) {
            return std::format("busy, position {}", f.position);
        } else if constexpr (std::is_same_v<T, TooLarge>) {
            return std::format("file too large: {} > {}", f.size, f.limit);
        } else {
            if (f.detail.empty()) return f.code.message();
            return std::format("{}: {}", f.code.message(), f.detail);
        }
    }, failure);
}

} // namespace ferry
