// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/queue/error.hpp>
#include <support/temp_dir.hpp>

using namespace ferry::core;
using ferry::queue::QueueErrc;

TEST_CASE("Default configuration", "[config]") {
    DownloadConfig download;
    CHECK(download.chunk_size == 1024 * 1024);
    CHECK(download.multipart_threshold == 12ull * 1024 * 1024);
    CHECK(download.max_workers == 6);
    CHECK(download.max_retries == 3);
    CHECK(download.retry_backoff.count() == Catch::Approx(0.75));
    CHECK(download.allow_resume);
    CHECK(download.temp_suffix == ".part");
    CHECK(download.probe_failure == ProbeFailurePolicy::degrade);
    CHECK_FALSE(validate(download));

    QueueConfig queue;
    CHECK(queue.min_workers == 4);
    CHECK(queue.max_workers == 10);
    CHECK(queue.max_queue_size == 300);
    CHECK(queue.per_user_rate_limit == 5);
    CHECK(queue.per_user_max_pending == 4);
    CHECK(queue.metric_window == 300);
    CHECK_FALSE(validate(queue));
}

TEST_CASE("Queue config validation", "[config]") {
    QueueConfig cfg;

    SECTION("min_workers below one") {
        cfg.min_workers = 0;
        CHECK(validate(cfg) == QueueErrc::invalid_config);
    }

    SECTION("max below min") {
        cfg.min_workers = 5;
        cfg.max_workers = 4;
        CHECK(validate(cfg) == QueueErrc::invalid_config);
    }

    SECTION("pending cap below one") {
        cfg.per_user_max_pending = 0;
        CHECK(validate(cfg) == QueueErrc::invalid_config);
    }

    SECTION("equal bounds are fine") {
        cfg.min_workers = 3;
        cfg.max_workers = 3;
        CHECK_FALSE(validate(cfg));
    }
}

TEST_CASE("Download config validation", "[config]") {
    DownloadConfig cfg;

    SECTION("zero chunk size") {
        cfg.chunk_size = 0;
        CHECK(validate(cfg) == DownloadErrc::invalid_config);
    }

    SECTION("zero range fetchers") {
        cfg.max_workers = 0;
        CHECK(validate(cfg) == DownloadErrc::invalid_config);
    }

    SECTION("empty temp suffix") {
        cfg.temp_suffix.clear();
        CHECK(validate(cfg) == DownloadErrc::invalid_config);
    }
}

TEST_CASE("parse_settings reads a JSON document", "[config]") {
    SECTION("missing keys keep defaults") {
        auto settings = parse_settings(R"({"download": {"chunk_size": 4096}})");
        REQUIRE(settings.has_value());
        CHECK(settings->download.chunk_size == 4096);
        CHECK(settings->download.max_workers == 6);
        CHECK(settings->queue.max_queue_size == 300);
        CHECK(settings->output_dir == "downloads");
    }

    SECTION("every section") {
        auto settings = parse_settings(R"({
            "output_dir": "/srv/files",
            "download": {
                "multipart_threshold": 1000,
                "stream_timeout": [2, 30],
                "allow_resume": false,
                "temp_suffix": ".tmp",
                "probe_failure": "fail"
            },
            "queue": {
                "min_workers": 1,
                "max_workers": 2,
                "per_user_window_seconds": 30,
                "idle_tick_ms": 50
            },
            "log": {"level": "debug", "file": "ferry.log"}
        })");
        REQUIRE(settings.has_value());
        CHECK(settings->output_dir == "/srv/files");
        CHECK(settings->download.multipart_threshold == 1000);
        CHECK(settings->download.connect_timeout.count() == Catch::Approx(2.0));
        CHECK(settings->download.read_timeout.count() == Catch::Approx(30.0));
        CHECK_FALSE(settings->download.allow_resume);
        CHECK(settings->download.temp_suffix == ".tmp");
        CHECK(settings->download.probe_failure == ProbeFailurePolicy::fail);
        CHECK(settings->queue.min_workers == 1);
        CHECK(settings->queue.max_workers == 2);
        CHECK(settings->queue.per_user_window.count() == Catch::Approx(30.0));
        CHECK(settings->queue.idle_tick == std::chrono::milliseconds{50});
        CHECK(settings->log.level == "debug");
        CHECK(settings->log.file == "ferry.log");
    }

    SECTION("malformed document") {
        CHECK_FALSE(parse_settings("{not json").has_value());
        CHECK_FALSE(parse_settings("[1, 2]").has_value());
    }

    SECTION("invalid values are rejected") {
        auto settings = parse_settings(R"({"queue": {"min_workers": 8, "max_workers": 2}})");
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == QueueErrc::invalid_config);
    }
}

TEST_CASE("load_settings reads from disk", "[config]") {
    ferry::test::TempDir dir;
    auto path = dir.file("ferry.json");
    ferry::test::write_file(path, R"({"queue": {"max_queue_size": 7}})");

    auto settings = load_settings(path);
    REQUIRE(settings.has_value());
    CHECK(settings->queue.max_queue_size == 7);

    CHECK_FALSE(load_settings(dir.file("missing.json")).has_value());
}
