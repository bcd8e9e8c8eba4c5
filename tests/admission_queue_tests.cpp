// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/queue/admission_queue.hpp>
#include <atomic>
#include <climits>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ferry;
using namespace ferry::queue;
using namespace std::chrono_literals;

namespace {

// Test clock advanced by hand
struct ManualClock {
    std::chrono::steady_clock::time_point base = std::chrono::steady_clock::now();
    std::shared_ptr<std::atomic<std::int64_t>> offset_ms = std::make_shared<std::atomic<std::int64_t>>(0);

    core::SteadyClock clock() const {
        return [base = base, offset = offset_ms] {
            return base + std::chrono::milliseconds(offset->load());
        };
    }
    void advance(std::chrono::milliseconds d) { offset_ms->fetch_add(d.count()); }
};

// Jobs block on the gate until it opens
struct Gate {
    std::promise<void> promise;
    std::shared_future<void> future = promise.get_future().share();

    void open() { promise.set_value(); }
    void wait() const { future.wait(); }
};

core::QueueConfig single_worker() {
    core::QueueConfig cfg;
    cfg.min_workers = 1;
    cfg.max_workers = 1;
    cfg.idle_tick = 10ms;
    return cfg;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

SubmitOptions for_user(UserId user, int priority = 0) {
    SubmitOptions options;
    options.user_id = user;
    options.priority = priority;
    return options;
}

} // namespace

TEST_CASE("AdmissionQueue rejects an invalid config", "[queue]") {
    core::QueueConfig cfg;
    cfg.min_workers = 3;
    cfg.max_workers = 2;
    auto created = AdmissionQueue::create(cfg);
    REQUIRE_FALSE(created.has_value());
    CHECK(created.error() == QueueErrc::invalid_config);
}

TEST_CASE("AdmissionQueue returns runner values", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());
    CHECK((*queue)->active_workers() == 1);

    auto submitted = (*queue)->submit([] { return 42; }, {});
    REQUIRE(submitted.has_value());
    CHECK(submitted->get() == 42);

    auto void_job = (*queue)->submit([] {}, {});
    REQUIRE(void_job.has_value());
    void_job->get();
}

TEST_CASE("AdmissionQueue serves by priority, then arrival", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int tag) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(tag);
    };

    Gate gate;
    std::promise<void> started;
    SubmitOptions first;
    first.priority = 20;
    auto a = (*queue)->submit([&] {
        record(20);
        started.set_value();
        gate.wait();
    }, first);
    REQUIRE(a.has_value());
    started.get_future().wait();

    SubmitOptions low;
    low.priority = 60;
    SubmitOptions high;
    high.priority = 10;
    SubmitOptions high_later;
    high_later.priority = 10;

    auto b = (*queue)->submit([&] { record(60); }, low);
    auto c = (*queue)->submit([&] { record(10); }, high);
    auto d = (*queue)->submit([&] { record(11); }, high_later);
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    REQUIRE(d.has_value());
    CHECK((*queue)->depth() == 3);

    gate.open();
    a->get();
    b->get();
    c->get();
    d->get();

    CHECK(order == std::vector<int>{20, 10, 11, 60});
}

TEST_CASE("AdmissionQueue per-user rate limit", "[queue]") {
    ManualClock clock;
    auto cfg = single_worker();
    cfg.per_user_rate_limit = 2;
    cfg.per_user_window = core::Seconds{30.0};
    cfg.per_user_max_pending = 10;
    auto queue = AdmissionQueue::create(cfg, clock.clock());
    REQUIRE(queue.has_value());

    auto first = (*queue)->submit([] { return 1; }, for_user(7));
    auto second = (*queue)->submit([] { return 2; }, for_user(7));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    first->get();
    second->get();

    clock.advance(10s);
    auto third = (*queue)->submit([] { return 3; }, for_user(7));
    REQUIRE_FALSE(third.has_value());
    REQUIRE(std::holds_alternative<RateLimited>(third.error()));
    CHECK(std::get<RateLimited>(third.error()).retry_after.count() == Catch::Approx(20.0));

    SECTION("other users are unaffected") {
        auto other = (*queue)->submit([] { return 4; }, for_user(8));
        REQUIRE(other.has_value());
        CHECK(other->get() == 4);
    }

    SECTION("the window rolls") {
        clock.advance(21s);
        auto later = (*queue)->submit([] { return 5; }, for_user(7));
        REQUIRE(later.has_value());
        CHECK(later->get() == 5);
    }

    SECTION("anonymous jobs skip the limit") {
        auto anon = (*queue)->submit([] { return 6; }, {});
        REQUIRE(anon.has_value());
        CHECK(anon->get() == 6);
    }
}

TEST_CASE("AdmissionQueue per-user pending cap", "[queue]") {
    auto cfg = single_worker();
    cfg.per_user_max_pending = 1;
    auto queue = AdmissionQueue::create(cfg);
    REQUIRE(queue.has_value());

    Gate gate;
    auto held = (*queue)->submit([&] { gate.wait(); return 1; }, for_user(1));
    REQUIRE(held.has_value());
    CHECK((*queue)->pending(1) == 1);

    auto rejected = (*queue)->submit([] { return 2; }, for_user(1));
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(std::holds_alternative<Busy>(rejected.error()));
    CHECK(std::get<Busy>(rejected.error()).position == 2);

    auto other = (*queue)->submit([] { return 3; }, for_user(2));
    REQUIRE(other.has_value());

    gate.open();
    CHECK(held->get() == 1);
    CHECK(other->get() == 3);

    // Settled before the future became ready
    CHECK((*queue)->pending(1) == 0);
    auto again = (*queue)->submit([] { return 4; }, for_user(1));
    REQUIRE(again.has_value());
    CHECK(again->get() == 4);
}

TEST_CASE("AdmissionQueue global backlog cap", "[queue]") {
    auto cfg = single_worker();
    cfg.max_queue_size = 2;
    auto queue = AdmissionQueue::create(cfg);
    REQUIRE(queue.has_value());

    Gate gate;
    std::promise<void> started;
    auto running = (*queue)->submit([&] { started.set_value(); gate.wait(); }, {});
    REQUIRE(running.has_value());
    started.get_future().wait();

    auto q1 = (*queue)->submit([] {}, {});
    auto q2 = (*queue)->submit([] {}, {});
    REQUIRE(q1.has_value());
    REQUIRE(q2.has_value());

    auto full = (*queue)->submit([] {}, {});
    REQUIRE_FALSE(full.has_value());
    REQUIRE(std::holds_alternative<Busy>(full.error()));
    CHECK(std::get<Busy>(full.error()).position == 3);
    CHECK(to_error_code(full.error()) == QueueErrc::busy);

    gate.open();
    running->get();
    q1->get();
    q2->get();
}

TEST_CASE("AdmissionQueue propagates runner exceptions", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    auto failing = (*queue)->submit([]() -> int { throw std::runtime_error("boom"); }, for_user(3));
    REQUIRE(failing.has_value());
    CHECK_THROWS_AS(failing->get(), std::runtime_error);
    CHECK((*queue)->pending(3) == 0);

    // The worker survived
    auto next = (*queue)->submit([] { return 7; }, {});
    REQUIRE(next.has_value());
    CHECK(next->get() == 7);
    CHECK((*queue)->active_workers() == 1);
}

TEST_CASE("AdmissionQueue on_queued callback", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    Gate gate;
    std::promise<void> started;
    auto blocker = (*queue)->submit([&] { started.set_value(); gate.wait(); }, {});
    REQUIRE(blocker.has_value());
    started.get_future().wait();

    QueueTicket seen;
    SubmitOptions options;
    options.on_queued = [&](const QueueTicket& ticket) { seen = ticket; };
    auto job = (*queue)->submit([] {}, options);
    REQUIRE(job.has_value());
    CHECK(seen.position == 1);
    CHECK(seen.queue_size == 1);
    CHECK(seen.active_workers == 1);

    SubmitOptions throwing;
    throwing.on_queued = [](const QueueTicket&) { throw std::runtime_error("notify failed"); };
    auto still_admitted = (*queue)->submit([] {}, throwing);
    CHECK(still_admitted.has_value());

    gate.open();
    blocker->get();
    job->get();
    still_admitted->get();
}

TEST_CASE("AdmissionQueue shutdown drains pending jobs", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        auto submitted = (*queue)->submit([&] {
            std::this_thread::sleep_for(2ms);
            ran.fetch_add(1);
        }, {});
        REQUIRE(submitted.has_value());
        futures.push_back(std::move(*submitted));
    }

    (*queue)->shutdown();
    CHECK(ran.load() == 5);
    CHECK((*queue)->active_workers() == 0);
    for (auto& f : futures) {
        CHECK(f.wait_for(0s) == std::future_status::ready);
    }

    auto late = (*queue)->submit([] {}, {});
    REQUIRE_FALSE(late.has_value());
    REQUIRE(std::holds_alternative<TransferFailed>(late.error()));
    CHECK(to_error_code(late.error()) == QueueErrc::shut_down);

    (*queue)->shutdown();  // idempotent
}

TEST_CASE("AdmissionQueue shutdown runs jobs of any priority", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    Gate gate;
    std::promise<void> started;
    auto blocker = (*queue)->submit([&] { started.set_value(); gate.wait(); }, {});
    REQUIRE(blocker.has_value());
    started.get_future().wait();

    auto lowest = (*queue)->submit([] { return 9; }, for_user(5, INT_MAX));
    auto at_marker = (*queue)->submit([] { return 8; }, for_user(6, SENTINEL_PRIORITY));
    REQUIRE(lowest.has_value());
    REQUIRE(at_marker.has_value());

    std::jthread opener([&] {
        std::this_thread::sleep_for(20ms);
        gate.open();
    });
    (*queue)->shutdown();

    REQUIRE(lowest->wait_for(0s) == std::future_status::ready);
    REQUIRE(at_marker->wait_for(0s) == std::future_status::ready);
    CHECK(lowest->get() == 9);
    CHECK(at_marker->get() == 8);
    CHECK((*queue)->pending(5) == 0);
    CHECK((*queue)->pending(6) == 0);
}

TEST_CASE("AdmissionQueue charges a repeated request once", "[queue]") {
    auto cfg = single_worker();
    cfg.per_user_rate_limit = 2;
    cfg.per_user_max_pending = 1;
    auto queue = AdmissionQueue::create(cfg);
    REQUIRE(queue.has_value());

    auto with_request = [](std::string id) {
        auto options = for_user(4);
        options.request_id = std::move(id);
        return options;
    };

    Gate gate;
    std::promise<void> started;
    auto first = (*queue)->submit([&] { started.set_value(); gate.wait(); return 1; }, with_request("r1"));
    REQUIRE(first.has_value());
    started.get_future().wait();

    // Same request: no new slot or window entry
    auto repeat = (*queue)->submit([] { return 2; }, with_request("r1"));
    auto again = (*queue)->submit([] { return 3; }, with_request("r1"));
    REQUIRE(repeat.has_value());
    REQUIRE(again.has_value());
    CHECK((*queue)->pending(4) == 1);

    // A different request still hits the pending cap
    auto other = (*queue)->submit([] { return 4; }, with_request("r2"));
    REQUIRE_FALSE(other.has_value());
    CHECK(std::holds_alternative<Busy>(other.error()));

    SECTION("the slot is held until the last submission finishes") {
        Gate tail_gate;
        auto tail = (*queue)->submit([&] { tail_gate.wait(); return 5; }, with_request("r1"));
        REQUIRE(tail.has_value());

        gate.open();
        CHECK(first->get() == 1);
        CHECK(repeat->get() == 2);
        CHECK(again->get() == 3);
        CHECK((*queue)->pending(4) == 1);

        tail_gate.open();
        CHECK(tail->get() == 5);
        CHECK((*queue)->pending(4) == 0);
    }

    SECTION("the slot frees once every submission settles") {
        gate.open();
        CHECK(first->get() == 1);
        CHECK(repeat->get() == 2);
        CHECK(again->get() == 3);
        CHECK((*queue)->pending(4) == 0);

        // One window entry was used by r1, the rejected r2 took the second
        auto next = (*queue)->submit([] { return 6; }, with_request("r3"));
        REQUIRE_FALSE(next.has_value());
        CHECK(std::holds_alternative<RateLimited>(next.error()));
    }
}

TEST_CASE("AdmissionQueue limits hold under concurrent submission", "[queue]") {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 4;

    auto cfg = single_worker();
    cfg.per_user_max_pending = 3;
    cfg.max_queue_size = 1000;

    auto limit = GENERATE(0u, 5u);
    cfg.per_user_rate_limit = limit;
    cfg.per_user_window = core::Seconds{60.0};

    auto queue = AdmissionQueue::create(cfg);
    REQUIRE(queue.has_value());

    Gate gate;
    std::atomic<std::uint32_t> peak{0};
    std::atomic<int> busy_count{0};
    std::atomic<int> limited_count{0};
    std::mutex futures_mutex;
    std::vector<std::future<void>> admitted;

    {
        std::promise<void> go;
        std::shared_future<void> start = go.get_future().share();
        std::vector<std::jthread> submitters;
        for (int t = 0; t < THREADS; ++t) {
            submitters.emplace_back([&] {
                start.wait();
                for (int i = 0; i < PER_THREAD; ++i) {
                    auto submitted = (*queue)->submit([&] { gate.wait(); }, for_user(9));
                    std::uint32_t seen = (*queue)->pending(9);
                    std::uint32_t prev = peak.load();
                    while (seen > prev && !peak.compare_exchange_weak(prev, seen)) {}

                    if (submitted) {
                        std::lock_guard<std::mutex> lock(futures_mutex);
                        admitted.push_back(std::move(*submitted));
                    } else if (std::holds_alternative<Busy>(submitted.error())) {
                        busy_count.fetch_add(1);
                    } else if (std::holds_alternative<RateLimited>(submitted.error())) {
                        limited_count.fetch_add(1);
                    }
                }
            });
        }
        go.set_value();
    }

    CHECK(admitted.size() == cfg.per_user_max_pending);
    CHECK(peak.load() <= cfg.per_user_max_pending);
    CHECK(busy_count.load() + limited_count.load() + static_cast<int>(admitted.size()) == THREADS * PER_THREAD);
    if (limit == 0) {
        CHECK(limited_count.load() == 0);
    } else {
        // Every charged attempt entered the window
        CHECK(busy_count.load() == static_cast<int>(limit - cfg.per_user_max_pending));
        CHECK(limited_count.load() == THREADS * PER_THREAD - static_cast<int>(limit));
    }

    gate.open();
    for (auto& f : admitted) f.get();
    CHECK((*queue)->pending(9) == 0);
}

TEST_CASE("AdmissionQueue records metrics per source", "[queue]") {
    auto queue = AdmissionQueue::create(single_worker());
    REQUIRE(queue.has_value());

    SubmitOptions tagged;
    tagged.source = "tiktok";
    auto a = (*queue)->submit([] {}, tagged);
    auto b = (*queue)->submit([] {}, {});
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    a->get();
    b->get();

    auto metrics = (*queue)->metrics_snapshot();
    REQUIRE(metrics.contains("tiktok"));
    REQUIRE(metrics.contains("generic"));
    CHECK(metrics["tiktok"].count == 1);
    CHECK((*queue)->global_snapshot().count == 2);
}

TEST_CASE("AdmissionQueue worker pool stays within bounds", "[queue]") {
    ManualClock clock;
    core::QueueConfig cfg;
    cfg.min_workers = 1;
    cfg.max_workers = 3;
    cfg.max_queue_size = 100;
    cfg.scale_cooldown = core::Seconds{0.0};
    cfg.idle_scale_down = core::Seconds{5.0};
    cfg.idle_tick = 10ms;
    auto created = AdmissionQueue::create(cfg, clock.clock());
    REQUIRE(created.has_value());
    auto& queue = **created;
    CHECK(queue.active_workers() == 1);

    // Spike: blocked jobs pile up
    Gate gate;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        auto submitted = queue.submit([&] { gate.wait(); }, {});
        REQUIRE(submitted.has_value());
        futures.push_back(std::move(*submitted));
        CHECK(queue.active_workers() <= 3);
    }
    CHECK(queue.active_workers() == 3);

    gate.open();
    for (auto& f : futures) f.get();
    CHECK(queue.active_workers() == 3);

    // Idle: shrink back to the floor once the queue has been empty long enough
    clock.advance(10s);
    CHECK(eventually([&] { return queue.active_workers() == 1; }));
    std::this_thread::sleep_for(100ms);
    CHECK(queue.active_workers() == 1);

    auto after = queue.submit([] { return 1; }, {});
    REQUIRE(after.has_value());
    CHECK(after->get() == 1);
}
