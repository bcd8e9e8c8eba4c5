// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/url.hpp>

using namespace ferry::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/file.zip");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->host() == "example.com");
        CHECK(result->path() == "/file.zip");
        CHECK(result->is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://127.0.0.1:8080/path");
        REQUIRE(result.has_value());
        CHECK(result->host() == "127.0.0.1");
        CHECK(result->port() == "8080");
        CHECK(!result->is_secure());
    }

    SECTION("Query is split off the path") {
        auto result = Url::parse("https://cdn.example.com/v1.2/archive.zip?sig=abc#frag");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/v1.2/archive.zip");
        CHECK(result->query() == "sig=abc");
        CHECK(result->full() == "https://cdn.example.com/v1.2/archive.zip?sig=abc#frag");
    }

    SECTION("Credentials are not part of the host") {
        auto result = Url::parse("https://user:pw@example.com/a");
        REQUIRE(result.has_value());
        CHECK(result->host() == "example.com");
    }

    SECTION("IPv6 literal") {
        auto result = Url::parse("http://[::1]:9000/x");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "9000");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK_FALSE(Url::parse("example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("ftp://example.com/file").has_value());
    CHECK_FALSE(Url::parse("http:///nohost").has_value());
    CHECK_FALSE(Url::parse("http://example.com:80a/").has_value());

    auto result = Url::parse("nope");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == DownloadErrc::invalid_url);
}

TEST_CASE("Url::filename extraction", "[url]") {
    CHECK(Url::parse("https://example.com/myfile.zip")->filename() == "myfile.zip");
    CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    CHECK(Url::parse("https://example.com/folder/")->filename() == "index.html");
    CHECK(Url::parse("https://example.com")->filename() == "index.html");
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
}
