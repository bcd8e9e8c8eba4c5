// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::queue {

using Seconds = std::chrono::duration<double>;

// Latency view over the retained samples
struct MetricSnapshot {
    std::size_t count{0};
    double processing_p50_ms{0.0};
    double processing_p95_ms{0.0};
    double queue_wait_p50_ms{0.0};
    double queue_wait_p95_ms{0.0};
};

// Order statistic: sort, then index round(q * (n - 1)) clamped to the
// bounds. 0 for an empty sample.
[[nodiscard]] double percentile(std::vector<double> values, double q);

// Fixed-capacity ring of samples; the oldest is overwritten when full
class SampleWindow {
public:
    explicit SampleWindow(std::size_t capacity);

    void push(double value);

    [[nodiscard]] std::vector<double> values() const;
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }

private:
    std::vector<double> buffer_;
    std::size_t head_{0};  // next slot to write
    std::size_t size_{0};
};

// Per-source queue-wait and processing samples. Thread-safe.
class MetricsRecorder {
public:
    explicit MetricsRecorder(std::size_t window);

    // Returns the number of completions recorded so far, this one included
    std::uint64_t record(std::string_view source, Seconds queue_wait, Seconds processing);

    [[nodiscard]] MetricSnapshot snapshot(std::string_view source) const;
    [[nodiscard]] std::map<std::string, MetricSnapshot> snapshots() const;

    // All sources pooled together
    [[nodiscard]] MetricSnapshot global_snapshot() const;

    [[nodiscard]] std::uint64_t completed() const;

private:
    struct Samples {
        explicit Samples(std::size_t window) : queue_wait(window), processing(window) {}

        SampleWindow queue_wait;
        SampleWindow processing;
    };

    [[nodiscard]] static MetricSnapshot summarize(const std::vector<double>& waits,
                                                  const std::vector<double>& runs);

    std::size_t window_;
    std::map<std::string, Samples, std::less<>> sources_;
    std::uint64_t completed_{0};
    mutable std::mutex mutex_;
};

} // namespace ferry::queue
