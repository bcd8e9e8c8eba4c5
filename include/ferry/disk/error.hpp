// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace ferry::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    truncate_error,
    rename_error,
    remove_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "File not found";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::disk_full:          return "Disk full";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::write_error:        return "Write error";
            case DiskErrc::truncate_error:     return "Could not resize file";
            case DiskErrc::rename_error:       return "Could not rename file";
            case DiskErrc::remove_error:       return "Could not remove file";
            case DiskErrc::handle_invalid:     return "Invalid handle";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an errno value from open/pwrite/ftruncate
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace ferry::disk

namespace std {

template<>
struct is_error_code_enum<ferry::disk::DiskErrc> : true_type {};

} // namespace std
