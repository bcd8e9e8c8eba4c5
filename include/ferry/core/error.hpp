// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>

namespace ferry::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    client_error,
    permission_denied,
    invalid_url,
    invalid_range,
    range_ignored,
    too_large,
    probe_failed,
    size_mismatch,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
    aborted,
    invalid_config,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::client_error:         return "Request rejected (4xx)";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::range_ignored:        return "Server ignored range request";
            case DownloadErrc::too_large:            return "File exceeds size limit";
            case DownloadErrc::probe_failed:         return "Probe failed";
            case DownloadErrc::size_mismatch:        return "Received size does not match";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::aborted:              return "Transfer aborted";
            case DownloadErrc::invalid_config:       return "Invalid download configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Map an HTTP status code to the matching error, or success for 1xx-3xx
[[nodiscard]] std::error_code http_status_error(long status) noexcept;

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::DownloadErrc> : true_type {};

} // namespace std
