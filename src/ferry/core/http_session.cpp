// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/http_session.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace ferry::core {

namespace {

// RAII header list cleanup
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
};

// State shared with libcurl callbacks for one request
struct Exchange {
    CURL* curl{nullptr};
    HttpResponse response;
    const HeadersHandler* on_headers{nullptr};
    const BodySink* sink{nullptr};
    bool headers_delivered{false};
    bool aborted{false};
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ex = static_cast<Exchange*>(userdata);
    if (!ex) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect, 100-continue)
    if (header.starts_with("HTTP/")) {
        ex->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    try {
        ex->response.headers[to_lower(name)] = std::string(value);
    } catch (...) {
        return 0;
    }
    return total;
}

void finish_headers(Exchange& ex) {
    long http_code = 0;
    curl_easy_getinfo(ex.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ex.response.status_code = static_cast<std::int32_t>(http_code);

    auto cl_it = ex.response.headers.find("content-length");
    if (cl_it != ex.response.headers.end()) {
        ex.response.has_content_length = parse_content_length(cl_it->second, ex.response.content_length);
    }

    auto ar_it = ex.response.headers.find("accept-ranges");
    ex.response.accepts_ranges = ar_it != ex.response.headers.end()
        && to_lower(ar_it->second).find("bytes") != std::string::npos;
}

bool deliver_headers(Exchange& ex) {
    ex.headers_delivered = true;
    finish_headers(ex);
    if (ex.on_headers && *ex.on_headers && !(*ex.on_headers)(ex.response)) {
        ex.aborted = true;
        return false;
    }
    return true;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ex = static_cast<Exchange*>(userdata);
    std::size_t total = size * nmemb;

    // Never let an exception unwind through libcurl
    try {
        if (!ex->headers_delivered && !deliver_headers(*ex)) {
            return 0;
        }
        if (ex->sink && *ex->sink && !(*ex->sink)(ptr, total)) {
            ex->aborted = true;
            return 0;
        }
    } catch (...) {
        ex->aborted = true;
        return 0;
    }
    return total;
}

std::error_code curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                    return {};
        case CURLE_OPERATION_TIMEDOUT:    return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_CONNECT:       return make_error_code(DownloadErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return make_error_code(DownloadErrc::dns_error);
        case CURLE_TOO_MANY_REDIRECTS:    return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:  return make_error_code(DownloadErrc::invalid_url);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:       return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:           return make_error_code(DownloadErrc::connection_lost);
        case CURLE_WRITE_ERROR:
        case CURLE_ABORTED_BY_CALLBACK:   return make_error_code(DownloadErrc::aborted);
        default:                          return make_error_code(DownloadErrc::network_error);
    }
}

long to_millis(Seconds s) noexcept {
    return static_cast<long>(std::llround(s.count() * 1000.0));
}

std::error_code configure(CURL* curl, const std::string& url,
                          const RequestOptions& options, HeaderList& list) {
    for (const auto& [name, value] : options.headers) {
        std::string line = name + ": " + value;
        auto* next = curl_slist_append(list.ptr, line.c_str());
        if (!next) return make_error_code(DownloadErrc::network_error);
        list.ptr = next;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, to_millis(options.connect_timeout));
    if (options.total_timeout.count() > 0.0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, to_millis(options.total_timeout));
    }

    // No-data window: below 1 byte/s for read_timeout seconds aborts
    auto stall = std::max(1L, static_cast<long>(std::ceil(options.read_timeout.count())));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    if (options.buffer_size > 0) {
        auto buffer = std::clamp<std::size_t>(options.buffer_size, CURL_MAX_WRITE_SIZE, 512 * 1024);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(buffer));
    }

    if (list.ptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list.ptr);
    }
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    return {};
}

std::error_code completion_error(CURLcode result, const Exchange& ex) noexcept {
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(ex.curl, CURLINFO_RESPONSE_CODE, &http_code);
        auto ec = http_status_error(http_code);
        return ec ? ec : make_error_code(DownloadErrc::client_error);
    }
    return curl_error(result);
}

} // namespace

//=============================================================================
// ConnectionPool
//=============================================================================

ConnectionPool::Lease::~Lease() {
    if (pool_ && handle_) {
        pool_->release(handle_);
    }
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , handle_(other.handle_) {
    other.pool_ = nullptr;
    other.handle_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (pool_ && handle_) pool_->release(handle_);
        pool_ = other.pool_;
        handle_ = other.handle_;
        other.pool_ = nullptr;
        other.handle_ = nullptr;
    }
    return *this;
}

ConnectionPool::ConnectionPool(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {
    idle_.reserve(capacity_);
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (void* handle : idle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle));
    }
    idle_.clear();
}

std::expected<ConnectionPool::Lease, std::error_code> ConnectionPool::acquire() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            void* handle = idle_.back();
            idle_.pop_back();
            return Lease(this, handle);
        }
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
    return Lease(this, curl);
}

std::size_t ConnectionPool::idle() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::release(void* handle) noexcept {
    auto* curl = static_cast<CURL*>(handle);
    // Clears options, keeps the live connection and DNS cache
    curl_easy_reset(curl);

    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < capacity_) {
        idle_.push_back(curl);
        return;
    }
    curl_easy_cleanup(curl);
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, const RequestOptions& options) noexcept {
    auto lease = pool_->acquire();
    if (!lease) {
        return std::unexpected(lease.error());
    }

    Exchange ex;
    ex.curl = static_cast<CURL*>(lease->handle());

    try {
        HeaderList list;
        if (auto ec = configure(ex.curl, url, options, list)) {
            return std::unexpected(ec);
        }
        curl_easy_setopt(ex.curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(ex.curl, CURLOPT_HEADERDATA, &ex);

        CURLcode result = curl_easy_perform(ex.curl);
        if (result != CURLE_OK) {
            return std::unexpected(completion_error(result, ex));
        }

        finish_headers(ex);
        return std::move(ex.response);
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 const RequestOptions& options,
                 const HeadersHandler& on_headers,
                 const BodySink& sink) noexcept {
    auto lease = pool_->acquire();
    if (!lease) {
        return std::unexpected(lease.error());
    }

    Exchange ex;
    ex.curl = static_cast<CURL*>(lease->handle());
    ex.on_headers = &on_headers;
    ex.sink = &sink;

    try {
        HeaderList list;
        if (auto ec = configure(ex.curl, url, options, list)) {
            return std::unexpected(ec);
        }
        curl_easy_setopt(ex.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(ex.curl, CURLOPT_HEADERDATA, &ex);
        curl_easy_setopt(ex.curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(ex.curl, CURLOPT_WRITEDATA, &ex);

        CURLcode result = curl_easy_perform(ex.curl);
        if (result != CURLE_OK) {
            if (ex.aborted) {
                return std::unexpected(make_error_code(DownloadErrc::aborted));
            }
            return std::unexpected(completion_error(result, ex));
        }

        // Empty body: headers were never handed over by the write callback
        if (!ex.headers_delivered && !deliver_headers(ex)) {
            return std::unexpected(make_error_code(DownloadErrc::aborted));
        }
        return std::move(ex.response);
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

//=============================================================================
// Helpers
//=============================================================================

std::string range_from(std::uint64_t first) {
    return "bytes=" + std::to_string(first) + "-";
}

std::string range_between(std::uint64_t first, std::uint64_t last) {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

bool parse_content_length(std::string_view value, std::uint64_t& out) noexcept {
    if (value.empty()) return false;
    std::uint64_t parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || end != value.data() + value.size()) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace ferry::core
