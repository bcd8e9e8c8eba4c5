// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/downloader.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::cli {

// One transfer handed to a worker process as JSON on stdin
struct WorkerPayload {
    std::string url;
    std::string filename;
    core::HeaderMap headers;
    bool skip_if_exists{false};
    std::string output_dir;
    std::string source{"worker"};
    std::optional<std::uint64_t> max_size_bytes;   // 0 in the payload means no cap
    core::DownloadConfig config;
};

[[nodiscard]] std::expected<WorkerPayload, std::error_code>
parse_payload(std::string_view json) noexcept;

// {url, path, size, elapsed, used_multipart, resumed}
[[nodiscard]] std::string metrics_to_json(const core::DownloadMetrics& metrics);

// Read one payload, run it, write metrics JSON to `out`.
// Returns the process exit code; failures are described on `err`.
[[nodiscard]] int run_worker(std::istream& in, std::ostream& out, std::ostream& err) noexcept;

} // namespace ferry::cli
