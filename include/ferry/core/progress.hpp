// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace ferry::core {

// Point-in-time view of one transfer
struct DownloadProgress {
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};           // best known, 0 when unknown
    Seconds elapsed{0.0};
    double speed_bps{0.0};                  // average since start
    std::optional<double> eta_seconds;      // set when total and speed are known
    bool done{false};
};

using ProgressSink = std::function<void(const DownloadProgress&)>;
// Snapshot maths shared by the tracker and tests
[[nodiscard]] DownloadProgress make_progress(std::uint64_t downloaded,
                                             std::uint64_t total,
                                             Seconds elapsed,
                                             bool done) noexcept;

// Bounded hand-off between transfer threads and one consumer thread.
// try_send() never blocks: a full channel drops the snapshot, except a
// final (done) snapshot, which replaces the newest queued one.
class ProgressChannel {
public:
    explicit ProgressChannel(ProgressSink sink,
                             std::size_t capacity = PROGRESS_CHANNEL_CAPACITY);
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    bool try_send(const DownloadProgress& progress) noexcept;

    // Deliver what is queued, then stop the consumer. Idempotent.
    void close() noexcept;

    [[nodiscard]] std::uint64_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    void run(std::stop_token stop);

    ProgressSink sink_;
    std::size_t capacity_;
    std::deque<DownloadProgress> items_;
    bool closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread consumer_;
};

// Counts bytes for one transfer and emits throttled snapshots.
// add() is safe from concurrent range fetchers.
class ProgressTracker {
public:
    ProgressTracker(ProgressChannel* channel,
                    std::uint64_t total,
                    std::uint64_t already_downloaded,
                    SteadyClock clock = steady_now);

    void add(std::uint64_t bytes) noexcept;
    void set_downloaded(std::uint64_t bytes) noexcept;
    void set_total(std::uint64_t total) noexcept;

    [[nodiscard]] std::uint64_t downloaded() const noexcept {
        return downloaded_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t total() const noexcept {
        return total_.load(std::memory_order_relaxed);
    }

    // Emit unless the last emit was less than PROGRESS_EMIT_INTERVAL ago.
    // force bypasses the throttle.
    void emit(bool force, bool done = false) noexcept;

    [[nodiscard]] DownloadProgress snapshot(bool done = false) const noexcept;

private:
    ProgressChannel* channel_;
    SteadyClock clock_;
    std::chrono::steady_clock::time_point started_;
    std::atomic<std::uint64_t> downloaded_;
    std::atomic<std::uint64_t> total_;
    std::optional<std::chrono::steady_clock::time_point> last_emit_;
    std::mutex emit_mutex_;
};

} // namespace ferry::core
