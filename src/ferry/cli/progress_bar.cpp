// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>

namespace ferry::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(&out)
    , label_(label) {}

void ProgressBar::update(const core::DownloadProgress& progress) {
    if (finished_) return;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (progress.total_bytes == 0) {
        line += SPINNER_FRAMES[frame_++ % 4];
        line += std::format(" {} @ {}", format_bytes(progress.downloaded_bytes),
                            format_speed(progress.speed_bps));
    } else {
        double percent = static_cast<double>(progress.downloaded_bytes) * 100.0
                       / static_cast<double>(progress.total_bytes);
        percent = std::clamp(percent, 0.0, 100.0);

        // Only redraw on whole-percent steps
        int whole = static_cast<int>(percent);
        if (whole == last_percent_ && !progress.done) return;
        last_percent_ = whole;

        line += render_bar(percent);
        line += std::format(" {:3}% ({}/{})", whole,
                            format_bytes(progress.downloaded_bytes),
                            format_bytes(progress.total_bytes));
        if (progress.speed_bps > 0.0) {
            line += " @ ";
            line += format_speed(progress.speed_bps);
        }
        if (progress.eta_seconds) {
            line += " ETA: ";
            line += format_time(static_cast<std::uint64_t>(*progress.eta_seconds));
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    *out_ << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    finished_ = true;
    *out_ << std::endl;
}

void ProgressBar::clear() {
    *out_ << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(bar_width - filled), ' ');
    bar += ']';
    return bar;
}

std::string format_speed(double bps) {
    if (bps >= GB) return std::format("{:.1f} GB/s", bps / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", bps / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", bps / KB);
    return std::format("{:.0f} B/s", bps);
}

std::string format_bytes(std::uint64_t bytes) {
    auto b = static_cast<double>(bytes);
    if (bytes >= TB) return std::format("{:.2f} TB", b / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", b / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", b / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", b / KB);
    return std::format("{} B", bytes);
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

} // namespace ferry::cli
