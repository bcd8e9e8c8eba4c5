// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/queue/admission_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ferry::queue {

namespace {

constexpr std::string_view DEFAULT_SOURCE = "generic";

} // namespace

std::expected<std::unique_ptr<AdmissionQueue>, std::error_code>
AdmissionQueue::create(core::QueueConfig config, core::SteadyClock clock) {
    if (auto ec = core::validate(config)) {
        return std::unexpected(ec);
    }

    std::unique_ptr<AdmissionQueue> queue(new AdmissionQueue(std::move(config), std::move(clock)));
    {
        std::lock_guard<std::mutex> structural(queue->structural_mutex_);
        for (std::uint32_t i = 0; i < queue->config_.min_workers; ++i) {
            queue->spawn_locked();
        }
    }

    spdlog::info("Download queue started: workers={} max_workers={} queue_cap={}",
                 queue->config_.min_workers, queue->config_.max_workers, queue->config_.max_queue_size);
    return queue;
}

AdmissionQueue::AdmissionQueue(core::QueueConfig config, core::SteadyClock clock)
    : config_(std::move(config))
    , clock_(std::move(clock))
    , metrics_(config_.metric_window)
    , last_non_empty_(clock_()) {
    jobs_.reserve(config_.max_queue_size + config_.max_workers);
}

AdmissionQueue::~AdmissionQueue() {
    shutdown();
}

std::size_t AdmissionQueue::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_jobs_;
}

std::uint32_t AdmissionQueue::pending(UserId user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(user);
    return it == pending_.end() ? 0 : it->second;
}

//=============================================================================
// Admission
//=============================================================================

std::expected<void, Failure> AdmissionQueue::admit(Task task, SubmitOptions options) {
    std::optional<QueueTicket> ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load(std::memory_order_acquire)) {
            return std::unexpected(Failure{TransferFailed{make_error_code(QueueErrc::shut_down),
                                                          "queue is shut down"}});
        }

        if (queued_jobs_ >= config_.max_queue_size) {
            return std::unexpected(Failure{busy(static_cast<std::int64_t>(queued_jobs_) + 1)});
        }

        auto now = clock_();

        // A repeat of an outstanding request rides on the first one's charge
        bool charged = options.user_id.has_value();
        if (options.user_id && options.request_id) {
            auto it = request_refs_.find({*options.user_id, *options.request_id});
            charged = it == request_refs_.end();
        }

        if (charged) {
            auto& window = rate_windows_[*options.user_id];
            while (!window.empty() && now - window.front() > config_.per_user_window) {
                window.pop_front();
            }
            // A limit of 0 disables the rolling cap
            if (config_.per_user_rate_limit > 0 && window.size() >= config_.per_user_rate_limit) {
                core::Seconds retry_after = config_.per_user_window - (now - window.front());
                return std::unexpected(Failure{rate_limited(retry_after.count())});
            }
            window.push_back(now);

            auto& in_flight = pending_[*options.user_id];
            if (in_flight >= config_.per_user_max_pending) {
                return std::unexpected(Failure{busy(static_cast<std::int64_t>(in_flight) + 1)});
            }
            ++in_flight;
        }
        if (options.user_id && options.request_id) {
            ++request_refs_[{*options.user_id, *options.request_id}];
        }

        Job job;
        job.priority = options.priority;
        job.created_at = now;
        job.source = options.source.empty() ? std::string(DEFAULT_SOURCE) : options.source;
        job.user_id = options.user_id;
        job.request_id = options.request_id;
        job.task = std::move(task);
        push_locked(std::move(job));
        ++queued_jobs_;
        last_non_empty_ = now;

        if (options.on_queued) {
            ticket = QueueTicket{queued_jobs_, queued_jobs_, active_workers()};
        }
    }
    cv_.notify_one();

    autotune();

    if (ticket) {
        try {
            options.on_queued(*ticket);
        } catch (const std::exception& e) {
            spdlog::debug("Queue on_queued callback failed: source={} user_id={} error={}",
                          options.source, options.user_id.value_or(0), e.what());
        }
    }
    return {};
}

void AdmissionQueue::push_locked(Job job) {
    job.order = ++sequence_;
    jobs_.push_back(std::move(job));
    std::push_heap(jobs_.begin(), jobs_.end(), ServedAfter{});
}

void AdmissionQueue::push_stop_locked(bool scale_down) {
    Job stop;
    stop.priority = SENTINEL_PRIORITY;
    stop.created_at = clock_();
    stop.source = "system";
    stop.stop_worker = true;
    stop.scale_down = scale_down;
    push_locked(std::move(stop));
    if (scale_down) ++retiring_;
}

//=============================================================================
// Workers
//=============================================================================

void AdmissionQueue::worker_loop(std::uint64_t id) {
    for (;;) {
        Job job;
        bool got = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, config_.idle_tick, [this] { return !jobs_.empty(); })) {
                std::pop_heap(jobs_.begin(), jobs_.end(), ServedAfter{});
                job = std::move(jobs_.back());
                jobs_.pop_back();
                got = true;

                if (!job.stop_worker) {
                    --queued_jobs_;
                }
                if (queued_jobs_ > 0) {
                    last_non_empty_ = clock_();
                }
            }
        }

        if (!got) {
            // Idle tick: lets the pool shrink without new traffic
            autotune();
            continue;
        }

        if (job.stop_worker) {
            retire(id, job.scale_down);
            return;
        }

        auto started = clock_();
        bool settled = false;
        std::function<void()> settle = [&] {
            if (settled) return;
            settled = true;
            finish(job, started);
        };
        job.task(settle);
        settle();

        autotune();
    }
}

void AdmissionQueue::finish(const Job& job, TimePoint started) noexcept {
    auto finished = clock_();

    if (job.user_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool release = true;
        if (job.request_id) {
            // Only the last submission of a shared request frees the slot
            auto ref = request_refs_.find({*job.user_id, *job.request_id});
            if (ref != request_refs_.end()) {
                if (ref->second <= 1) {
                    request_refs_.erase(ref);
                } else {
                    --ref->second;
                    release = false;
                }
            }
        }
        auto it = release ? pending_.find(*job.user_id) : pending_.end();
        if (it != pending_.end()) {
            if (it->second <= 1) {
                pending_.erase(it);
            } else {
                --it->second;
            }
        }
    }

    try {
        auto completed = metrics_.record(job.source, started - job.created_at, finished - started);
        if (config_.metrics_log_every > 0 && completed % config_.metrics_log_every == 0) {
            log_metrics(completed);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Queue metrics update failed: source={} error={}", job.source, e.what());
    }
}

void AdmissionQueue::log_metrics(std::uint64_t completed) {
    auto snap = metrics_.global_snapshot();
    spdlog::info("Queue metrics: jobs={} workers={} depth={} queue_wait_p50={:.0f}ms queue_wait_p95={:.0f}ms "
                 "processing_p50={:.0f}ms processing_p95={:.0f}ms",
                 completed, active_workers(), depth(),
                 snap.queue_wait_p50_ms, snap.queue_wait_p95_ms,
                 snap.processing_p50_ms, snap.processing_p95_ms);
}

//=============================================================================
// Scaling
//=============================================================================

void AdmissionQueue::autotune() {
    std::lock_guard<std::mutex> structural(structural_mutex_);
    reap_locked();

    if (stopping_.load(std::memory_order_acquire)) return;

    auto now = clock_();
    if (last_scale_action_ && now - *last_scale_action_ < config_.scale_cooldown) {
        return;
    }

    std::size_t current = workers_.size();
    if (current == 0) {
        spawn_locked();
        last_scale_action_ = now;
        return;
    }

    std::size_t queue_depth = 0;
    std::size_t retiring = 0;
    TimePoint last_non_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_depth = queued_jobs_;
        retiring = retiring_;
        last_non_empty = last_non_empty_;
    }

    core::Seconds wait_p95{metrics_.global_snapshot().queue_wait_p95_ms / 1000.0};

    bool scale_up = current < config_.max_workers
        && (queue_depth > current * 2 || wait_p95 > config_.scale_up_wait_p95);
    if (scale_up) {
        spawn_locked();
        last_scale_action_ = now;
        spdlog::info("Queue auto-tune scale up: workers={} depth={} wait_p95={:.2f}s",
                     workers_.size(), queue_depth, wait_p95.count());
        return;
    }

    // Workers that will stay once queued stop markers are consumed
    std::size_t staying = current > retiring ? current - retiring : 0;
    core::Seconds idle_for = now - last_non_empty;

    bool scale_down = staying > config_.min_workers
        && queue_depth == 0
        && wait_p95 < config_.idle_wait_p95
        && idle_for > config_.idle_scale_down;
    if (scale_down) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            push_stop_locked(true);
        }
        cv_.notify_one();
        last_scale_action_ = now;
        spdlog::info("Queue auto-tune scale down requested: workers={}", staying - 1);
    }
}

void AdmissionQueue::spawn_locked() {
    auto id = ++worker_sequence_;
    workers_.emplace(id, std::jthread([this, id] { worker_loop(id); }));
    active_workers_.store(workers_.size(), std::memory_order_release);
}

void AdmissionQueue::retire(std::uint64_t id, bool scale_down) {
    std::lock_guard<std::mutex> structural(structural_mutex_);
    if (scale_down) {
        // Paired with the extract below under the structural lock
        std::lock_guard<std::mutex> lock(mutex_);
        --retiring_;
    }
    auto node = workers_.extract(id);
    if (node.empty()) {
        return;  // shutdown already owns this thread
    }
    // A thread cannot join itself; the next structural pass reaps it
    retired_.push_back(std::move(node.mapped()));
    active_workers_.store(workers_.size(), std::memory_order_release);
    spdlog::debug("Queue worker retired: id={} workers={}", id, workers_.size());
}

void AdmissionQueue::reap_locked() {
    for (auto& thread : retired_) {
        if (thread.joinable()) thread.join();
    }
    retired_.clear();
}

void AdmissionQueue::shutdown() {
    std::map<std::uint64_t, std::jthread> workers;
    std::vector<std::jthread> retired;
    {
        std::lock_guard<std::mutex> structural(structural_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stopping_.exchange(true, std::memory_order_acq_rel)) {
                for (std::size_t i = 0; i < workers_.size(); ++i) {
                    push_stop_locked(false);
                }
            }
        }
        workers.swap(workers_);
        retired.swap(retired_);
        active_workers_.store(0, std::memory_order_release);
    }
    cv_.notify_all();

    for (auto& [id, thread] : workers) {
        if (thread.joinable()) thread.join();
    }
    for (auto& thread : retired) {
        if (thread.joinable()) thread.join();
    }

    if (!workers.empty()) {
        spdlog::info("Download queue stopped: workers={} completed={}", workers.size(), metrics_.completed());
    }
}

} // namespace ferry::queue
