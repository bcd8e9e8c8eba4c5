// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/worker_host.hpp>
#include <ferry/failure.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <iterator>

namespace ferry::cli {

std::expected<WorkerPayload, std::error_code> parse_payload(std::string_view json) noexcept {
    try {
        if (json.empty()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        auto j = nlohmann::json::parse(json);
        if (!j.is_object() || !j.contains("url") || !j.contains("filename") || !j.contains("output_dir")) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        WorkerPayload payload;
        payload.url = j["url"].get<std::string>();
        payload.filename = j["filename"].get<std::string>();
        payload.output_dir = j["output_dir"].get<std::string>();

        if (j.contains("headers") && j["headers"].is_object()) {
            for (auto& [key, value] : j["headers"].items()) {
                payload.headers.emplace(key, value.get<std::string>());
            }
        }
        if (j.contains("skip_if_exists")) {
            payload.skip_if_exists = j["skip_if_exists"].get<bool>();
        }
        if (j.contains("source") && j["source"].is_string()) {
            payload.source = j["source"].get<std::string>();
        }
        if (j.contains("max_size_bytes") && j["max_size_bytes"].is_number_unsigned()) {
            auto cap = j["max_size_bytes"].get<std::uint64_t>();
            if (cap > 0) payload.max_size_bytes = cap;
        }

        // Same keys as the "download" section of a settings file
        if (j.contains("config") && j["config"].is_object()) {
            nlohmann::json wrapped;
            wrapped["download"] = j["config"];
            auto settings = core::parse_settings(wrapped.dump());
            if (!settings) {
                return std::unexpected(settings.error());
            }
            payload.config = settings->download;
        }
        return payload;
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::string metrics_to_json(const core::DownloadMetrics& metrics) {
    nlohmann::json j;
    j["url"] = metrics.url;
    j["path"] = metrics.path;
    j["size"] = metrics.size;
    j["elapsed"] = metrics.elapsed.count();
    j["used_multipart"] = metrics.used_multipart;
    j["resumed"] = metrics.resumed;
    return j.dump();
}

int run_worker(std::istream& in, std::ostream& out, std::ostream& err) noexcept {
    try {
        std::string raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        auto payload = parse_payload(raw);
        if (!payload) {
            err << "Invalid worker payload: " << payload.error().message() << std::flush;
            return 1;
        }

        core::Downloader downloader(payload->config, payload->output_dir);

        core::DownloadRequest request;
        request.url = payload->url;
        request.filename = payload->filename;
        request.headers = payload->headers;
        request.skip_if_exists = payload->skip_if_exists;
        request.max_size_bytes = payload->max_size_bytes;

        auto metrics = downloader.download(request);
        if (!metrics) {
            err << describe(metrics.error()) << std::flush;
            return 1;
        }

        core::log_download_metrics(payload->source, *metrics);
        out << metrics_to_json(*metrics) << std::flush;
        return 0;
    } catch (const std::exception& e) {
        err << e.what() << std::flush;
        return 1;
    }
}

} // namespace ferry::cli
