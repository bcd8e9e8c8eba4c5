// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace ferry::core {

DownloadProgress make_progress(std::uint64_t downloaded,
                               std::uint64_t total,
                               Seconds elapsed,
                               bool done) noexcept {
    DownloadProgress p;
    p.downloaded_bytes = downloaded;
    p.total_bytes = total;
    p.elapsed = std::max(elapsed, Seconds{0.001});
    p.speed_bps = static_cast<double>(downloaded) / p.elapsed.count();
    p.done = done;

    if (total > 0 && p.speed_bps > 0.0 && downloaded < total) {
        p.eta_seconds = static_cast<double>(total - downloaded) / p.speed_bps;
    }
    return p;
}

//=============================================================================
// ProgressChannel
//=============================================================================

ProgressChannel::ProgressChannel(ProgressSink sink, std::size_t capacity)
    : sink_(std::move(sink))
    , capacity_(std::max<std::size_t>(1, capacity)) {
    consumer_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

ProgressChannel::~ProgressChannel() {
    close();
}

bool ProgressChannel::try_send(const DownloadProgress& progress) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (items_.size() >= capacity_) {
            if (!progress.done) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            items_.pop_back();
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        try {
            items_.push_back(progress);
        } catch (const std::bad_alloc&) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }
    cv_.notify_one();
    return true;
}

void ProgressChannel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void ProgressChannel::run(std::stop_token stop) {
    for (;;) {
        DownloadProgress item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, stop, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return;  // closed and drained, or stop requested
            }
            item = items_.front();
            items_.pop_front();
        }

        if (!sink_) continue;
        try {
            sink_(item);
        } catch (const std::exception& e) {
            spdlog::debug("Progress sink failed: error={}", e.what());
        } catch (...) {
            spdlog::debug("Progress sink failed: error=unknown");
        }
    }
}

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressTracker::ProgressTracker(ProgressChannel* channel,
                                 std::uint64_t total,
                                 std::uint64_t already_downloaded,
                                 SteadyClock clock)
    : channel_(channel)
    , clock_(std::move(clock))
    , started_(clock_())
    , downloaded_(already_downloaded)
    , total_(total) {}

void ProgressTracker::add(std::uint64_t bytes) noexcept {
    downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    emit(false);
}

void ProgressTracker::set_downloaded(std::uint64_t bytes) noexcept {
    downloaded_.store(bytes, std::memory_order_relaxed);
}

void ProgressTracker::set_total(std::uint64_t total) noexcept {
    total_.store(total, std::memory_order_relaxed);
}

DownloadProgress ProgressTracker::snapshot(bool done) const noexcept {
    return make_progress(downloaded(), total(), clock_() - started_, done);
}

void ProgressTracker::emit(bool force, bool done) noexcept {
    if (!channel_) return;

    std::unique_lock<std::mutex> lock(emit_mutex_, std::defer_lock);
    if (force) {
        lock.lock();
    } else if (!lock.try_lock()) {
        return;  // another fetcher is emitting right now
    }

    auto now = clock_();
    if (!force && last_emit_ && now - *last_emit_ < PROGRESS_EMIT_INTERVAL) {
        return;
    }
    last_emit_ = now;
    channel_->try_send(make_progress(downloaded(), total(), now - started_, done));
}

} // namespace ferry::core
