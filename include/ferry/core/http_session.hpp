// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

// Header names are stored lower-case
using HeaderMap = std::map<std::string, std::string>;

struct HttpResponse {
    std::int32_t status_code{0};
    HeaderMap headers;
    std::uint64_t content_length{0};   // 0 when absent or not numeric
    bool has_content_length{false};
    bool accepts_ranges{false};
};

// Reusable libcurl easy handles. Handles keep their connection cache
// between leases, so range fetchers reuse TCP/TLS sessions.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        [[nodiscard]] void* handle() const noexcept { return handle_; }  // CURL*

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, void* handle) noexcept : pool_(pool), handle_(handle) {}

        ConnectionPool* pool_{nullptr};
        void* handle_{nullptr};
    };

    explicit ConnectionPool(std::size_t capacity);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Reuse an idle handle or create a new one
    [[nodiscard]] std::expected<Lease, std::error_code> acquire() noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t idle() const noexcept;

private:
    void release(void* handle) noexcept;

    std::size_t capacity_;
    std::vector<void*> idle_;
    mutable std::mutex mutex_;
};

struct RequestOptions {
    HeaderMap headers;
    Seconds connect_timeout{5.0};
    Seconds read_timeout{60.0};    // abort when no byte arrives for this long
    Seconds total_timeout{0.0};    // 0: unlimited
    std::size_t buffer_size{0};    // 0: libcurl default
};

// Called once, when the final response headers are known. Return false to abort.
using HeadersHandler = std::function<bool(const HttpResponse&)>;

// Receives body bytes in arrival order. Return false to abort.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

class HttpSession {
public:
    explicit HttpSession(ConnectionPool& pool) noexcept : pool_(&pool) {}

    // HEAD request; status >= 400 is reported as an error
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, const RequestOptions& options) noexcept;

    // Streaming GET; status >= 400 is reported as an error and no body
    // bytes reach the sink
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const RequestOptions& options,
        const HeadersHandler& on_headers,
        const BodySink& sink) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    ConnectionPool* pool_;
};

// Range header values: "bytes=<first>-" and "bytes=<first>-<last>"
[[nodiscard]] std::string range_from(std::uint64_t first);
[[nodiscard]] std::string range_between(std::uint64_t first, std::uint64_t last);

// Strict decimal parse; false for empty or non-numeric values
[[nodiscard]] bool parse_content_length(std::string_view value, std::uint64_t& out) noexcept;

} // namespace ferry::core
