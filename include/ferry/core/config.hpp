// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::core {

using namespace std::chrono_literals;

using Seconds = std::chrono::duration<double>;

// Injectable time source; tests drive a fake one
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline std::chrono::steady_clock::time_point steady_now() {
    return std::chrono::steady_clock::now();
}

constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;                    // 1 MiB
constexpr std::uint64_t DEFAULT_MULTIPART_THRESHOLD = 12 * 1024 * 1024;    // 12 MiB
constexpr std::uint32_t DEFAULT_RANGE_WORKERS = 6;
constexpr std::uint32_t DEFAULT_RETRY_COUNT = 3;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;

constexpr Seconds PROGRESS_EMIT_INTERVAL{0.8};
constexpr std::size_t PROGRESS_CHANNEL_CAPACITY = 64;

// What to do when every HEAD attempt failed
enum class ProbeFailurePolicy : std::uint8_t {
    degrade,  // continue as size 0, no range support
    fail      // report TransferFailed
};

// Per-transfer knobs
struct DownloadConfig {
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint64_t multipart_threshold{DEFAULT_MULTIPART_THRESHOLD};
    std::uint32_t max_workers{DEFAULT_RANGE_WORKERS};  // parallel range fetchers per job
    Seconds head_timeout{8.0};
    Seconds connect_timeout{5.0};                      // stream timeout, connect phase
    Seconds read_timeout{60.0};                        // stream timeout, no-data window
    std::uint32_t max_retries{DEFAULT_RETRY_COUNT};
    Seconds retry_backoff{0.75};                       // linear: backoff * attempt
    bool allow_resume{true};
    std::string temp_suffix{".part"};
    ProbeFailurePolicy probe_failure{ProbeFailurePolicy::degrade};
};

// Worker pool and admission knobs
struct QueueConfig {
    std::uint32_t min_workers{4};
    std::uint32_t max_workers{10};
    std::size_t max_queue_size{300};
    std::uint32_t per_user_rate_limit{5};
    Seconds per_user_window{10.0};
    std::uint32_t per_user_max_pending{4};
    std::size_t metric_window{300};
    Seconds scale_cooldown{8.0};
    Seconds idle_scale_down{40.0};
    Seconds scale_up_wait_p95{2.0};
    Seconds idle_wait_p95{0.25};
    std::uint64_t metrics_log_every{25};
    std::chrono::milliseconds idle_tick{1000};         // idle workers re-check scaling
};

struct LogConfig {
    std::string level{"info"};
    std::string file;                                  // empty: stderr only
};

// Everything a process needs at start
struct Settings {
    DownloadConfig download;
    QueueConfig queue;
    LogConfig log;
    std::string output_dir{"downloads"};
};

[[nodiscard]] std::error_code validate(const DownloadConfig& cfg) noexcept;
[[nodiscard]] std::error_code validate(const QueueConfig& cfg) noexcept;

// Parse a JSON settings document. Missing keys keep their defaults.
[[nodiscard]] std::expected<Settings, std::error_code>
parse_settings(std::string_view json) noexcept;

// Read and parse a JSON settings file
[[nodiscard]] std::expected<Settings, std::error_code>
load_settings(std::string_view path) noexcept;

} // namespace ferry::core
