// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/service/transfer_service.hpp>
#include <ferry/core/config.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace ferry::service {

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

} // namespace

int resolve_priority(std::optional<int> priority, std::optional<std::uint64_t> size_hint) noexcept {
    if (priority) return *priority;
    if (!size_hint || *size_hint == 0) return 40;
    if (*size_hint <= 25 * MiB) return 10;
    if (*size_hint <= 120 * MiB) return 25;
    return 50;
}

std::expected<std::future<TransferResult>, Failure>
TransferService::fetch_async(TransferRequest request) {
    queue::SubmitOptions options;
    options.priority = resolve_priority(request.priority, request.size_hint);
    options.source = request.source.empty() ? std::string("generic") : request.source;
    options.user_id = request.user_id;
    options.request_id = request.request_id;
    options.on_queued = std::move(request.on_queued);

    core::DownloadRequest job;
    job.url = std::move(request.url);
    job.filename = std::move(request.filename);
    job.headers = std::move(request.headers);
    job.skip_if_exists = request.skip_if_exists;
    job.max_size_bytes = request.max_size_bytes;
    job.on_progress = std::move(request.on_progress);

    auto* downloader = downloader_;
    return queue_->submit(
        [downloader, job = std::move(job)]() -> TransferResult {
            return downloader->download(job);
        },
        std::move(options));
}

TransferResult TransferService::fetch(TransferRequest request) {
    auto source = request.source.empty() ? std::string("generic") : request.source;

    auto future = fetch_async(std::move(request));
    if (!future) {
        spdlog::info("Transfer rejected: source={} reason={}", source, describe(future.error()));
        return std::unexpected(std::move(future.error()));
    }

    try {
        auto result = future->get();
        if (result) {
            core::log_download_metrics(source, *result);
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Transfer job failed: source={} error={}", source, e.what());
        return std::unexpected(Failure{TransferFailed{
            make_error_code(core::DownloadErrc::network_error), e.what()}});
    }
}

} // namespace ferry::service
