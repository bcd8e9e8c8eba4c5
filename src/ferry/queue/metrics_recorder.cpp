// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/queue/metrics_recorder.hpp>
#include <algorithm>
#include <cmath>

namespace ferry::queue {

namespace {

constexpr std::string_view DEFAULT_SOURCE = "generic";

} // namespace

double percentile(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    if (values.size() == 1) return values.front();

    std::sort(values.begin(), values.end());
    // Round half to even
    double rank = std::nearbyint(q * static_cast<double>(values.size() - 1));
    auto index = static_cast<std::size_t>(std::clamp(rank, 0.0, static_cast<double>(values.size() - 1)));
    return values[index];
}

//=============================================================================
// SampleWindow
//=============================================================================

SampleWindow::SampleWindow(std::size_t capacity)
    : buffer_(std::max<std::size_t>(1, capacity), 0.0) {}

void SampleWindow::push(double value) {
    buffer_[head_] = value;
    head_ = (head_ + 1) % buffer_.size();
    if (size_ < buffer_.size()) ++size_;
}

std::vector<double> SampleWindow::values() const {
    std::vector<double> out;
    out.reserve(size_);
    std::size_t start = (head_ + buffer_.size() - size_) % buffer_.size();
    for (std::size_t i = 0; i < size_; ++i) {
        out.push_back(buffer_[(start + i) % buffer_.size()]);
    }
    return out;
}

//=============================================================================
// MetricsRecorder
//=============================================================================

MetricsRecorder::MetricsRecorder(std::size_t window)
    : window_(std::max<std::size_t>(1, window)) {}

std::uint64_t MetricsRecorder::record(std::string_view source, Seconds queue_wait, Seconds processing) {
    if (source.empty()) source = DEFAULT_SOURCE;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sources_.find(source);
    if (it == sources_.end()) {
        it = sources_.emplace(std::string(source), Samples(window_)).first;
    }
    it->second.queue_wait.push(std::max(0.0, queue_wait.count()));
    it->second.processing.push(std::max(0.0, processing.count()));
    return ++completed_;
}

MetricSnapshot MetricsRecorder::summarize(const std::vector<double>& waits,
                                          const std::vector<double>& runs) {
    MetricSnapshot snap;
    snap.count = std::max(waits.size(), runs.size());
    snap.processing_p50_ms = percentile(runs, 0.50) * 1000.0;
    snap.processing_p95_ms = percentile(runs, 0.95) * 1000.0;
    snap.queue_wait_p50_ms = percentile(waits, 0.50) * 1000.0;
    snap.queue_wait_p95_ms = percentile(waits, 0.95) * 1000.0;
    return snap;
}

MetricSnapshot MetricsRecorder::snapshot(std::string_view source) const {
    if (source.empty()) source = DEFAULT_SOURCE;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sources_.find(source);
    if (it == sources_.end()) {
        return {};
    }
    return summarize(it->second.queue_wait.values(), it->second.processing.values());
}

std::map<std::string, MetricSnapshot> MetricsRecorder::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, MetricSnapshot> out;
    for (const auto& [name, samples] : sources_) {
        out.emplace(name, summarize(samples.queue_wait.values(), samples.processing.values()));
    }
    return out;
}

MetricSnapshot MetricsRecorder::global_snapshot() const {
    std::vector<double> waits;
    std::vector<double> runs;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, samples] : sources_) {
        auto w = samples.queue_wait.values();
        auto r = samples.processing.values();
        waits.insert(waits.end(), w.begin(), w.end());
        runs.insert(runs.end(), r.begin(), r.end());
    }
    return summarize(waits, runs);
}

std::uint64_t MetricsRecorder::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

} // namespace ferry::queue
