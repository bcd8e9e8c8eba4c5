// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/failure.hpp>
#include <ferry/queue/error.hpp>
#include <ferry/queue/metrics_recorder.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <expected>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <unordered_map>
#include <vector>

namespace ferry::queue {

using UserId = std::int64_t;

// Priority carried by stop markers; they sort behind every job regardless
constexpr int SENTINEL_PRIORITY = 1'000'000'000;

// Snapshot handed to on_queued right after enqueue
struct QueueTicket {
    std::size_t position{0};
    std::size_t queue_size{0};
    std::size_t active_workers{0};
};

struct SubmitOptions {
    int priority{0};                                    // lower is served first
    std::string source{"generic"};                      // metrics grouping
    std::optional<UserId> user_id;                      // enables fairness limits
    // Submissions sharing (user_id, request_id) while one is outstanding are
    // charged a single rate-window entry and a single pending slot
    std::optional<std::string> request_id;
    std::function<void(const QueueTicket&)> on_queued;  // best effort
};

// Priority work queue with per-user admission control and an elastic
// worker pool. Jobs run in (priority, arrival) order; a running job is
// never preempted.
class AdmissionQueue {
public:
    // Validates the config and starts min_workers workers
    [[nodiscard]] static std::expected<std::unique_ptr<AdmissionQueue>, std::error_code>
    create(core::QueueConfig config, core::SteadyClock clock = core::steady_now);

    ~AdmissionQueue();

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;

    // Admit `runner` or reject it without creating a job. The returned
    // future carries the runner's value or exception. There is no timeout:
    // callers race the future themselves.
    template <typename F>
    [[nodiscard]] auto submit(F&& runner, SubmitOptions options)
        -> std::expected<std::future<std::invoke_result_t<std::decay_t<F>&>>, Failure>;

    // Queue one stop marker per worker behind the pending jobs and wait for
    // every worker to exit. Later submissions are rejected.
    void shutdown();

    [[nodiscard]] std::size_t active_workers() const noexcept {
        return active_workers_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::size_t depth() const;
    [[nodiscard]] std::uint32_t pending(UserId user) const;

    [[nodiscard]] std::map<std::string, MetricSnapshot> metrics_snapshot() const {
        return metrics_.snapshots();
    }
    [[nodiscard]] MetricSnapshot global_snapshot() const { return metrics_.global_snapshot(); }

    [[nodiscard]] const core::QueueConfig& config() const noexcept { return config_; }

private:
    // Runs the job and publishes its result. `settle` must be called once,
    // right before the result becomes visible to the caller.
    using Task = std::move_only_function<void(const std::function<void()>& settle)>;
    using TimePoint = std::chrono::steady_clock::time_point;

    struct Job {
        int priority{0};
        std::uint64_t order{0};
        TimePoint created_at;
        std::string source;
        std::optional<UserId> user_id;
        std::optional<std::string> request_id;
        Task task;
        bool stop_worker{false};
        bool scale_down{false};   // stop marker from the autotuner
    };

    // Heap order: jobs before stop markers, then the smallest (priority, order)
    struct ServedAfter {
        bool operator()(const Job& a, const Job& b) const noexcept {
            if (a.stop_worker != b.stop_worker) return a.stop_worker;
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.order > b.order;
        }
    };

    AdmissionQueue(core::QueueConfig config, core::SteadyClock clock);

    [[nodiscard]] std::expected<void, Failure> admit(Task task, SubmitOptions options);

    void push_locked(Job job);
    void push_stop_locked(bool scale_down);
    void worker_loop(std::uint64_t id);
    void finish(const Job& job, TimePoint started) noexcept;
    void autotune();
    void spawn_locked();
    void retire(std::uint64_t id, bool scale_down);
    void reap_locked();
    void log_metrics(std::uint64_t completed);

    core::QueueConfig config_;
    core::SteadyClock clock_;
    MetricsRecorder metrics_;

    // Queue contents and per-user admission state
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Job> jobs_;
    std::size_t queued_jobs_{0};            // jobs_ minus stop markers
    std::size_t retiring_{0};               // scale-down markers whose worker is still listed
    std::uint64_t sequence_{0};
    TimePoint last_non_empty_;
    std::unordered_map<UserId, std::deque<TimePoint>> rate_windows_;
    std::unordered_map<UserId, std::uint32_t> pending_;
    std::map<std::pair<UserId, std::string>, std::uint32_t> request_refs_;
    std::atomic<bool> stopping_{false};

    // Worker-count changes; taken before mutex_ when both are needed
    std::mutex structural_mutex_;
    std::map<std::uint64_t, std::jthread> workers_;
    std::vector<std::jthread> retired_;
    std::optional<TimePoint> last_scale_action_;
    std::uint64_t worker_sequence_{0};
    std::atomic<std::size_t> active_workers_{0};
};

template <typename F>
auto AdmissionQueue::submit(F&& runner, SubmitOptions options)
    -> std::expected<std::future<std::invoke_result_t<std::decay_t<F>&>>, Failure> {
    using R = std::invoke_result_t<std::decay_t<F>&>;

    std::promise<R> promise;
    auto future = promise.get_future();

    Task task = [fn = std::forward<F>(runner), promise = std::move(promise)]
                (const std::function<void()>& settle) mutable {
        bool settled = false;
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                settled = true;
                settle();
                promise.set_value();
            } else {
                R value = fn();
                settled = true;
                settle();
                promise.set_value(std::move(value));
            }
        } catch (...) {
            if (!settled) settle();
            promise.set_exception(std::current_exception());
        }
    };

    auto admitted = admit(std::move(task), std::move(options));
    if (!admitted) {
        return std::unexpected(std::move(admitted.error()));
    }
    return future;
}

} // namespace ferry::queue
