// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/progress.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace ferry::cli {

// Single-line terminal progress for one transfer. Falls back to a spinner
// with a byte counter while the total size is unknown.
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    void update(const core::DownloadProgress& progress);

    // Finish the progress bar
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream* out_;
    std::string label_;
    std::size_t frame_{0};
    int last_percent_{-1};
    bool finished_{false};
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(double bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace ferry::cli
