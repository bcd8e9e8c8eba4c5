// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/progress.hpp>
#include <ferry/disk/file_writer.hpp>
#include <ferry/failure.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::core {

// Result of a finished transfer
struct DownloadMetrics {
    std::string url;
    std::string path;
    std::uint64_t size{0};       // bytes on disk after finalize
    Seconds elapsed{0.0};
    bool used_multipart{false};
    bool resumed{false};
};

struct DownloadRequest {
    std::string url;
    std::string filename;                          // relative to the output directory
    HeaderMap headers;                             // merged over the default headers
    bool skip_if_exists{false};
    std::optional<std::uint64_t> max_size_bytes;
    ProgressSink on_progress;                      // called from a consumer thread
};

// What a HEAD probe learned about a resource
struct ProbeResult {
    std::uint64_t size{0};                         // 0 when unknown
    bool accepts_ranges{false};
};

// Probe, then single-stream or multipart fetch with retry and resume.
// download() may run concurrently from several threads.
class Downloader {
public:
    Downloader(DownloadConfig config, std::string output_dir, HeaderMap default_headers = {});
    ~Downloader();

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    [[nodiscard]] std::expected<DownloadMetrics, Failure>
    download(const DownloadRequest& request);

    // HEAD with linear-backoff retries
    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const std::string& url, const HeaderMap& headers);

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& output_dir() const noexcept { return output_dir_; }

private:
    struct Transfer;

    [[nodiscard]] std::error_code run(Transfer& t);
    [[nodiscard]] std::error_code download_single(Transfer& t);
    [[nodiscard]] std::error_code stream_once(Transfer& t);
    [[nodiscard]] std::error_code download_multipart(Transfer& t);
    [[nodiscard]] std::error_code fetch_range(Transfer& t, disk::FileWriter& writer,
                                              std::uint64_t first, std::uint64_t last);

    void backoff(std::uint32_t attempt) const;
    void cleanup(const Transfer& t) const noexcept;

    [[nodiscard]] RequestOptions stream_options(const HeaderMap& headers) const;

    DownloadConfig config_;
    std::string output_dir_;
    HeaderMap default_headers_;
    ConnectionPool pool_;
    HttpSession session_;
};

// Unified completion line for the log
void log_download_metrics(std::string_view source, const DownloadMetrics& metrics);

} // namespace ferry::core
