// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/queue/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace ferry::core {

namespace {

using nlohmann::json;

template<typename T>
void read_number(const json& j, const char* key, T& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

void read_seconds(const json& j, const char* key, Seconds& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = Seconds{j[key].get<double>()};
    }
}

void read_download(const json& j, DownloadConfig& cfg) {
    read_number(j, "chunk_size", cfg.chunk_size);
    read_number(j, "multipart_threshold", cfg.multipart_threshold);
    read_number(j, "max_workers", cfg.max_workers);
    read_seconds(j, "head_timeout", cfg.head_timeout);
    read_seconds(j, "connect_timeout", cfg.connect_timeout);
    read_seconds(j, "read_timeout", cfg.read_timeout);

    // [connect, read] pair, as sent by worker payloads
    if (j.contains("stream_timeout") && j["stream_timeout"].is_array()
        && j["stream_timeout"].size() == 2) {
        cfg.connect_timeout = Seconds{j["stream_timeout"][0].get<double>()};
        cfg.read_timeout = Seconds{j["stream_timeout"][1].get<double>()};
    }

    read_number(j, "max_retries", cfg.max_retries);
    read_seconds(j, "retry_backoff", cfg.retry_backoff);
    if (j.contains("allow_resume") && j["allow_resume"].is_boolean()) {
        cfg.allow_resume = j["allow_resume"].get<bool>();
    }
    if (j.contains("temp_suffix") && j["temp_suffix"].is_string()) {
        cfg.temp_suffix = j["temp_suffix"].get<std::string>();
    }
    if (j.contains("probe_failure") && j["probe_failure"].is_string()) {
        cfg.probe_failure = j["probe_failure"].get<std::string>() == "fail"
            ? ProbeFailurePolicy::fail
            : ProbeFailurePolicy::degrade;
    }
}

void read_queue(const json& j, QueueConfig& cfg) {
    read_number(j, "min_workers", cfg.min_workers);
    read_number(j, "max_workers", cfg.max_workers);
    read_number(j, "max_queue_size", cfg.max_queue_size);
    read_number(j, "per_user_rate_limit", cfg.per_user_rate_limit);
    read_seconds(j, "per_user_window_seconds", cfg.per_user_window);
    read_number(j, "per_user_max_pending", cfg.per_user_max_pending);
    read_number(j, "metric_window", cfg.metric_window);
    read_seconds(j, "scale_cooldown_seconds", cfg.scale_cooldown);
    read_seconds(j, "idle_scale_down_seconds", cfg.idle_scale_down);
    read_seconds(j, "scale_up_wait_p95_seconds", cfg.scale_up_wait_p95);
    read_seconds(j, "idle_wait_p95_seconds", cfg.idle_wait_p95);
    if (j.contains("idle_tick_ms") && j["idle_tick_ms"].is_number()) {
        cfg.idle_tick = std::chrono::milliseconds{j["idle_tick_ms"].get<std::int64_t>()};
    }
    read_number(j, "metrics_log_every", cfg.metrics_log_every);
}

} // namespace

std::error_code validate(const DownloadConfig& cfg) noexcept {
    if (cfg.chunk_size == 0 || cfg.max_workers == 0 || cfg.temp_suffix.empty()) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (cfg.retry_backoff.count() < 0.0 || cfg.head_timeout.count() <= 0.0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::error_code validate(const QueueConfig& cfg) noexcept {
    using queue::QueueErrc;
    if (cfg.min_workers < 1) return make_error_code(QueueErrc::invalid_config);
    if (cfg.max_workers < cfg.min_workers) return make_error_code(QueueErrc::invalid_config);
    if (cfg.per_user_max_pending < 1) return make_error_code(QueueErrc::invalid_config);
    if (cfg.metric_window == 0) return make_error_code(QueueErrc::invalid_config);
    if (cfg.per_user_window.count() < 0.0) return make_error_code(QueueErrc::invalid_config);
    if (cfg.idle_tick.count() <= 0) return make_error_code(QueueErrc::invalid_config);
    return {};
}

std::expected<Settings, std::error_code>
parse_settings(std::string_view text) noexcept {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        Settings settings;
        if (j.contains("download") && j["download"].is_object()) {
            read_download(j["download"], settings.download);
        }
        if (j.contains("queue") && j["queue"].is_object()) {
            read_queue(j["queue"], settings.queue);
        }
        if (j.contains("log") && j["log"].is_object()) {
            const auto& l = j["log"];
            if (l.contains("level") && l["level"].is_string()) settings.log.level = l["level"].get<std::string>();
            if (l.contains("file") && l["file"].is_string()) settings.log.file = l["file"].get<std::string>();
        }
        if (j.contains("output_dir") && j["output_dir"].is_string()) {
            settings.output_dir = j["output_dir"].get<std::string>();
        }

        if (auto ec = validate(settings.download)) return std::unexpected(ec);
        if (auto ec = validate(settings.queue)) return std::unexpected(ec);
        return settings;
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::expected<Settings, std::error_code>
load_settings(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_settings(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

} // namespace ferry::core
