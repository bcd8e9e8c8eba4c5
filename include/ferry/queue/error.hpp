// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace ferry::queue {

enum class QueueErrc {
    success = 0,
    rate_limited,
    busy,
    shut_down,
    invalid_config,
};

namespace detail {

struct QueueErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::queue";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<QueueErrc>(ev)) {
            case QueueErrc::success:         return "Success";
            case QueueErrc::rate_limited:    return "Submission rate limit exceeded";
            case QueueErrc::busy:            return "Queue is busy";
            case QueueErrc::shut_down:       return "Queue is shut down";
            case QueueErrc::invalid_config:  return "Invalid queue configuration";
            default:                         return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::QueueErrcCategory& queue_errc_category() noexcept {
    static detail::QueueErrcCategory category;
    return category;
}

inline std::error_code make_error_code(QueueErrc e) noexcept {
    return {static_cast<int>(e), queue_errc_category()};
}

} // namespace ferry::queue

namespace std {

template<>
struct is_error_code_enum<ferry::queue::QueueErrc> : true_type {};

} // namespace std
