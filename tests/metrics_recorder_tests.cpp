// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/queue/metrics_recorder.hpp>

using namespace ferry::queue;

TEST_CASE("percentile picks an order statistic", "[metrics]") {
    CHECK(percentile({}, 0.5) == 0.0);
    CHECK(percentile({7.0}, 0.95) == 7.0);
    CHECK(percentile({5.0, 1.0, 4.0, 2.0, 3.0}, 0.5) == 3.0);
    CHECK(percentile({5.0, 1.0, 4.0, 2.0, 3.0}, 0.95) == 5.0);
    CHECK(percentile({5.0, 1.0, 4.0, 2.0, 3.0}, 0.0) == 1.0);
    CHECK(percentile({5.0, 1.0, 4.0, 2.0, 3.0}, 1.0) == 5.0);

    SECTION("ties round to the even index") {
        CHECK(percentile({1.0, 2.0}, 0.5) == 1.0);              // rank 0.5 -> 0
        CHECK(percentile({1.0, 2.0, 3.0, 4.0}, 0.5) == 3.0);    // rank 1.5 -> 2
    }
}

TEST_CASE("SampleWindow keeps the newest samples", "[metrics]") {
    SampleWindow window(3);
    CHECK(window.values().empty());

    window.push(1.0);
    window.push(2.0);
    CHECK(window.values() == std::vector<double>{1.0, 2.0});

    window.push(3.0);
    window.push(4.0);
    CHECK(window.size() == 3);
    CHECK(window.values() == std::vector<double>{2.0, 3.0, 4.0});
}

TEST_CASE("MetricsRecorder groups by source", "[metrics]") {
    MetricsRecorder recorder(300);

    CHECK(recorder.record("youtube", Seconds{0.010}, Seconds{1.0}) == 1);
    CHECK(recorder.record("youtube", Seconds{0.030}, Seconds{3.0}) == 2);
    CHECK(recorder.record("", Seconds{0.5}, Seconds{0.2}) == 3);
    CHECK(recorder.completed() == 3);

    auto yt = recorder.snapshot("youtube");
    CHECK(yt.count == 2);
    CHECK(yt.queue_wait_p50_ms == Catch::Approx(10.0));
    CHECK(yt.queue_wait_p95_ms == Catch::Approx(30.0));
    CHECK(yt.processing_p95_ms == Catch::Approx(3000.0));

    auto generic = recorder.snapshot("generic");
    CHECK(generic.count == 1);
    CHECK(generic.queue_wait_p50_ms == Catch::Approx(500.0));

    auto all = recorder.snapshots();
    REQUIRE(all.size() == 2);
    CHECK(all.contains("generic"));
    CHECK(all.contains("youtube"));

    auto global = recorder.global_snapshot();
    CHECK(global.count == 3);
    CHECK(global.queue_wait_p95_ms == Catch::Approx(500.0));

    CHECK(recorder.snapshot("unknown").count == 0);
}

TEST_CASE("MetricsRecorder window is bounded", "[metrics]") {
    MetricsRecorder recorder(2);
    recorder.record("a", Seconds{10.0}, Seconds{1.0});
    recorder.record("a", Seconds{0.001}, Seconds{1.0});
    recorder.record("a", Seconds{0.001}, Seconds{1.0});

    auto snap = recorder.snapshot("a");
    CHECK(snap.count == 2);
    CHECK(snap.queue_wait_p95_ms == Catch::Approx(1.0));
    CHECK(recorder.completed() == 3);
}
