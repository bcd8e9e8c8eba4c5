// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/downloader.hpp>
#include <ferry/core/byte_range.hpp>
#include <ferry/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ferry::core {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HeaderMap merge_headers(const HeaderMap& defaults, const HeaderMap& overrides) {
    HeaderMap merged;
    merged["user-agent"] = user_agent();
    for (const auto& [name, value] : defaults) merged[lower(name)] = value;
    for (const auto& [name, value] : overrides) merged[lower(name)] = value;
    return merged;
}

// Local (disk) failures and size caps are never retried
bool retryable(std::error_code ec) noexcept {
    if (ec.category() != download_errc_category()) return false;
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::too_large:
        case DownloadErrc::range_ignored:
        case DownloadErrc::invalid_url:
        case DownloadErrc::aborted:
        case DownloadErrc::invalid_config:
            return false;
        default:
            return true;
    }
}

// Batches network reads into chunk-sized sequential writes
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t chunk_size) : chunk_size_(std::max<std::size_t>(1, chunk_size)) {
        data_.reserve(chunk_size_);
    }

    [[nodiscard]] std::error_code put(disk::FileWriter& writer, const char* data, std::size_t size) {
        data_.insert(data_.end(), data, data + size);
        if (data_.size() >= chunk_size_) {
            return drain(writer);
        }
        return {};
    }

    [[nodiscard]] std::error_code drain(disk::FileWriter& writer) noexcept {
        if (data_.empty()) return {};
        auto ec = writer.append(data_.data(), data_.size());
        data_.clear();
        return ec;
    }

private:
    std::size_t chunk_size_;
    std::vector<char> data_;
};

} // namespace

// Per-call state, owned by download()
struct Downloader::Transfer {
    explicit Transfer(const DownloadRequest& r) : request(r) {}

    const DownloadRequest& request;
    std::string target;
    std::string temp;
    HeaderMap headers;
    std::uint64_t total{0};
    bool accepts_ranges{false};
    bool resumed{false};
    bool multipart{false};
    std::uint64_t offset{0};                // next single-stream attempt starts here
    std::optional<TooLarge> too_large;
    std::error_code local_error;            // raised inside a body callback
    std::unique_ptr<ProgressChannel> channel;
    std::unique_ptr<ProgressTracker> tracker;
};

//=============================================================================
// Downloader
//=============================================================================

Downloader::Downloader(DownloadConfig config, std::string output_dir, HeaderMap default_headers)
    : config_(std::move(config))
    , output_dir_(std::move(output_dir))
    , default_headers_(std::move(default_headers))
    , pool_(static_cast<std::size_t>(std::max<std::uint32_t>(1, config_.max_workers)) * 2)
    , session_(pool_) {}

Downloader::~Downloader() = default;

std::expected<DownloadMetrics, Failure> Downloader::download(const DownloadRequest& request) {
    if (request.filename.empty()) {
        auto ec = make_error_code(disk::DiskErrc::invalid_path);
        return std::unexpected(Failure{TransferFailed{ec, "empty destination filename"}});
    }

    Transfer t(request);
    t.target = (std::filesystem::path(output_dir_) / request.filename).string();
    t.temp = t.target + config_.temp_suffix;

    auto parent = std::filesystem::path(t.target).parent_path().string();
    if (auto ec = disk::ensure_directory(parent.empty() ? output_dir_ : parent)) {
        spdlog::error("Download failed: url={} path={} error={}", request.url, t.target, ec.message());
        return std::unexpected(Failure{TransferFailed{ec, ec.message()}});
    }

    if (request.skip_if_exists && disk::exists(t.target)) {
        if (auto size = disk::file_size(t.target)) {
            spdlog::debug("Download skipped because file already exists: url={} path={} size={}",
                          request.url, t.target, *size);
            return DownloadMetrics{request.url, t.target, *size, Seconds{0.0}, false, false};
        }
    }

    t.headers = merge_headers(default_headers_, request.headers);
    if (request.on_progress) {
        t.channel = std::make_unique<ProgressChannel>(request.on_progress);
    }

    auto started = std::chrono::steady_clock::now();
    auto ec = run(t);

    std::expected<std::uint64_t, std::error_code> size = std::unexpected(ec);
    if (!ec) {
        // Authoritative size comes from the filesystem
        size = disk::file_size(t.target);
        if (!size) ec = size.error();
    }

    if (ec) {
        Failure failure = t.too_large
            ? Failure{*t.too_large}
            : Failure{TransferFailed{ec, ec.message()}};
        spdlog::error("Download failed: url={} path={} error={}", request.url, t.target, describe(failure));
        cleanup(t);
        if (t.channel) t.channel->close();
        return std::unexpected(std::move(failure));
    }

    DownloadMetrics metrics{
        request.url,
        t.target,
        *size,
        std::chrono::steady_clock::now() - started,
        t.multipart,
        t.resumed,
    };

    spdlog::info("Download finished: url={} path={} size={} elapsed={:.2f}s multipart={} resumed={}",
                 metrics.url, metrics.path, metrics.size, metrics.elapsed.count(),
                 metrics.used_multipart, metrics.resumed);

    if (t.tracker) {
        t.tracker->set_downloaded(metrics.size);
        t.tracker->set_total(std::max(t.tracker->total(), metrics.size));
        t.tracker->emit(true, true);
    }
    if (t.channel) t.channel->close();
    return metrics;
}

std::error_code Downloader::run(Transfer& t) {
    const auto& url = t.request.url;
    const auto& max = t.request.max_size_bytes;

    auto probed = probe(url, t.headers);
    if (probed) {
        t.total = probed->size;
        t.accepts_ranges = probed->accepts_ranges;
    } else if (config_.probe_failure == ProbeFailurePolicy::fail) {
        spdlog::warn("Probe failed: url={} error={}", url, probed.error().message());
        return make_error_code(DownloadErrc::probe_failed);
    } else {
        spdlog::warn("Probe failed, falling back to conservative download: url={} error={}",
                     url, probed.error().message());
    }

    if (max && t.total > 0 && t.total > *max) {
        t.too_large = TooLarge{t.total, *max};
        return make_error_code(DownloadErrc::too_large);
    }

    const bool caller_range = t.headers.contains("range");

    if (config_.allow_resume && t.accepts_ranges && !caller_range && disk::exists(t.temp)) {
        auto existing = disk::file_size(t.temp);
        if (existing && *existing > 0) {
            if (t.total > 0 && *existing > t.total) {
                spdlog::warn("Discarding oversized partial file: path={} size={} total={}",
                             t.temp, *existing, t.total);
            } else {
                t.resumed = true;
                t.offset = *existing;
                spdlog::debug("Resuming partial download: url={} path={} resume_from={} total={}",
                              url, t.temp, t.offset, t.total);
            }
        }
    }

    t.tracker = std::make_unique<ProgressTracker>(t.channel.get(), t.total, t.offset);
    if (max && t.offset > *max) {
        t.too_large = TooLarge{t.offset, *max};
        return make_error_code(DownloadErrc::too_large);
    }
    t.tracker->emit(false);

    t.multipart = t.accepts_ranges
        && t.total > 0
        && t.total >= config_.multipart_threshold
        && !t.resumed
        && !caller_range;

    std::error_code ec;
    if (t.resumed && t.total > 0 && t.offset == t.total) {
        spdlog::debug("Partial file already complete: path={} size={}", t.temp, t.offset);
    } else if (t.multipart) {
        ec = download_multipart(t);
    } else {
        ec = download_single(t);
    }
    if (ec) return ec;

    return disk::rename_file(t.temp, t.target);
}

std::error_code Downloader::download_single(Transfer& t) {
    const bool can_continue = t.accepts_ranges && config_.allow_resume && !t.headers.contains("range");

    for (std::uint32_t attempt = 1;; ++attempt) {
        auto ec = stream_once(t);
        if (!ec) return {};
        if (t.too_large || !retryable(ec) || attempt > config_.max_retries) {
            return ec;
        }

        spdlog::warn("Sequential download retry: url={} attempt={} sleep={:.2f}s error={}",
                     t.request.url, attempt, (config_.retry_backoff * attempt).count(), ec.message());
        backoff(attempt);

        // Pick up from what reached the disk when the server honours ranges
        t.offset = 0;
        if (can_continue) {
            if (auto size = disk::file_size(t.temp)) t.offset = *size;
        }
    }
}

std::error_code Downloader::stream_once(Transfer& t) {
    if (t.total > 0 && t.offset > 0 && t.offset >= t.total) {
        return {};
    }

    const auto& max = t.request.max_size_bytes;
    std::uint64_t base = t.offset;

    auto headers = t.headers;
    if (base > 0) headers["range"] = range_from(base);
    auto options = stream_options(headers);

    std::optional<disk::FileWriter> writer;
    ChunkBuffer buffer(config_.chunk_size);
    std::uint64_t received = base;
    t.local_error.clear();
    t.tracker->set_downloaded(base);

    HeadersHandler on_headers = [&](const HttpResponse& response) {
        if (base > 0 && response.status_code != 206) {
            spdlog::warn("Server ignored range request, restarting from zero: url={} status={}",
                         t.request.url, response.status_code);
            base = 0;
            received = 0;
            t.offset = 0;
            t.resumed = false;
            t.tracker->set_downloaded(0);
        }

        if (t.total == 0 && response.has_content_length) {
            t.total = base + response.content_length;
            t.tracker->set_total(t.total);
        }
        if (max && t.total > *max) {
            t.too_large = TooLarge{t.total, *max};
            return false;
        }

        auto opened = disk::FileWriter::open(t.temp, base > 0 ? disk::OpenMode::append
                                                              : disk::OpenMode::truncate);
        if (!opened) {
            t.local_error = opened.error();
            return false;
        }
        writer.emplace(std::move(*opened));
        return true;
    };

    BodySink sink = [&](const char* data, std::size_t size) {
        if (max && received + size > *max) {
            t.too_large = TooLarge{received + size, *max};
            return false;
        }
        if (auto ec = buffer.put(*writer, data, size)) {
            t.local_error = ec;
            return false;
        }
        received += size;
        t.tracker->add(size);
        return true;
    };

    auto result = session_.get(t.request.url, options, on_headers, sink);

    // Keep what arrived so a retry can continue from it
    std::error_code flush_ec;
    if (writer) {
        flush_ec = buffer.drain(*writer);
        if (!flush_ec) flush_ec = writer->flush();
        writer->close();
    }

    if (t.too_large) return make_error_code(DownloadErrc::too_large);
    if (t.local_error) return t.local_error;
    if (!result) return result.error();
    if (flush_ec) return flush_ec;

    t.offset = received;
    t.tracker->emit(true);
    return {};
}

std::error_code Downloader::download_multipart(Transfer& t) {
    auto ranges = split_ranges(t.total, config_.multipart_threshold, config_.max_workers);

    auto opened = disk::FileWriter::open(t.temp, disk::OpenMode::truncate);
    if (!opened) return opened.error();
    disk::FileWriter writer = std::move(*opened);
    if (auto ec = writer.resize(t.total)) return ec;

    std::size_t fetchers = std::min<std::size_t>(std::max<std::uint32_t>(1, config_.max_workers),
                                                 ranges.size());
    spdlog::debug("Multipart download: url={} size={} ranges={} fetchers={}",
                  t.request.url, t.total, ranges.size(), fetchers);

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::error_code first_error;

    {
        std::vector<std::jthread> threads;
        threads.reserve(fetchers);
        for (std::size_t i = 0; i < fetchers; ++i) {
            threads.emplace_back([&] {
                while (!failed.load(std::memory_order_acquire)) {
                    auto index = next.fetch_add(1, std::memory_order_relaxed);
                    if (index >= ranges.size()) return;

                    auto ec = fetch_range(t, writer, ranges[index].first, ranges[index].last);
                    if (ec) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) first_error = ec;
                        failed.store(true, std::memory_order_release);
                        return;
                    }
                }
            });
        }
    }

    if (first_error) return first_error;
    if (auto ec = writer.flush()) return ec;
    writer.close();
    t.tracker->emit(true);
    return {};
}

std::error_code Downloader::fetch_range(Transfer& t, disk::FileWriter& writer,
                                        std::uint64_t first, std::uint64_t last) {
    const std::uint64_t length = last - first + 1;
    std::uint64_t done = 0;  // bytes of this range already written

    for (std::uint32_t attempt = 1;; ++attempt) {
        auto headers = t.headers;
        headers["range"] = range_between(first + done, last);
        auto options = stream_options(headers);
        std::error_code local;

        HeadersHandler on_headers = [&](const HttpResponse& response) {
            if (response.status_code != 206) {
                local = make_error_code(DownloadErrc::range_ignored);
                return false;
            }
            return true;
        };

        BodySink sink = [&](const char* data, std::size_t size) {
            if (done + size > length) {
                local = make_error_code(DownloadErrc::invalid_range);
                return false;
            }
            if (auto ec = writer.write_at(first + done, data, size)) {
                local = ec;
                return false;
            }
            done += size;
            t.tracker->add(size);
            return true;
        };

        auto result = session_.get(t.request.url, options, on_headers, sink);

        std::error_code ec = local;
        if (!ec && !result) ec = result.error();
        if (!ec && done != length) ec = make_error_code(DownloadErrc::size_mismatch);
        if (!ec) return {};

        if (!retryable(ec) || attempt > config_.max_retries) {
            return ec;
        }
        spdlog::debug("Range fetch retry: url={} range={}-{} attempt={} sleep={:.2f}s error={}",
                      t.request.url, first, last, attempt,
                      (config_.retry_backoff * attempt).count(), ec.message());
        backoff(attempt);
    }
}

std::expected<ProbeResult, std::error_code>
Downloader::probe(const std::string& url, const HeaderMap& headers) {
    RequestOptions options;
    options.headers = headers;
    options.connect_timeout = std::min(config_.connect_timeout, config_.head_timeout);
    options.read_timeout = config_.head_timeout;
    options.total_timeout = config_.head_timeout;

    for (std::uint32_t attempt = 1;; ++attempt) {
        auto response = session_.head(url, options);
        if (response) {
            ProbeResult result{
                response->has_content_length ? response->content_length : 0,
                response->accepts_ranges,
            };
            spdlog::debug("Probe successful: url={} size={} supports_range={}",
                          url, result.size, result.accepts_ranges);
            return result;
        }

        if (!retryable(response.error()) || attempt > config_.max_retries) {
            return std::unexpected(response.error());
        }
        spdlog::debug("HEAD probe retry: url={} attempt={} sleep={:.2f}s error={}",
                      url, attempt, (config_.retry_backoff * attempt).count(),
                      response.error().message());
        backoff(attempt);
    }
}

RequestOptions Downloader::stream_options(const HeaderMap& headers) const {
    RequestOptions options;
    options.headers = headers;
    options.connect_timeout = config_.connect_timeout;
    options.read_timeout = config_.read_timeout;
    options.buffer_size = config_.chunk_size;
    return options;
}

void Downloader::backoff(std::uint32_t attempt) const {
    std::this_thread::sleep_for(config_.retry_backoff * attempt);
}

void Downloader::cleanup(const Transfer& t) const noexcept {
    for (const std::string* path : {&t.temp, &t.target}) {
        if (auto ec = disk::remove_file(*path)) {
            spdlog::warn("Failed to clean up partial download: path={} error={}", *path, ec.message());
        }
    }
}

void log_download_metrics(std::string_view source, const DownloadMetrics& metrics) {
    double size_mb = static_cast<double>(metrics.size) / (1024.0 * 1024.0);
    spdlog::info("Download metrics: source={} url={} path={} size={:.2f}MB elapsed={:.2f}s multipart={} resumed={}",
                 source, metrics.url, metrics.path, size_mb, metrics.elapsed.count(),
                 metrics.used_multipart, metrics.resumed);
}

} // namespace ferry::core
