// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>

namespace ferry::core {

std::error_code http_status_error(long status) noexcept {
    if (status < 400) return {};
    switch (status) {
        case 401:
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        default: break;
    }
    return status >= 500
        ? make_error_code(DownloadErrc::server_error)
        : make_error_code(DownloadErrc::client_error);
}

} // namespace ferry::core
