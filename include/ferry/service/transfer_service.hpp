// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/downloader.hpp>
#include <ferry/failure.hpp>
#include <ferry/queue/admission_queue.hpp>
#include <cstdint>
#include <expected>
#include <future>
#include <optional>
#include <string>

namespace ferry::service {

using TransferResult = std::expected<core::DownloadMetrics, Failure>;

// One transfer as a collaborator describes it
struct TransferRequest {
    std::string url;
    std::string filename;
    core::HeaderMap headers;
    bool skip_if_exists{false};
    std::optional<std::uint64_t> max_size_bytes;
    std::optional<queue::UserId> user_id;
    std::optional<std::string> request_id;                     // dedupes repeats per user
    std::string source;                                        // empty: "generic"
    std::optional<int> priority;                               // explicit wins over size_hint
    std::optional<std::uint64_t> size_hint;
    std::function<void(const queue::QueueTicket&)> on_queued;
    core::ProgressSink on_progress;
};

// Queue priority from an explicit value or a size hint; smaller files first
[[nodiscard]] int resolve_priority(std::optional<int> priority,
                                   std::optional<std::uint64_t> size_hint) noexcept;

// Runs transfers as queue jobs. Owns neither the queue nor the downloader.
class TransferService {
public:
    TransferService(queue::AdmissionQueue& queue, core::Downloader& downloader) noexcept
        : queue_(&queue), downloader_(&downloader) {}

    // Admission failures come back immediately, without a job
    [[nodiscard]] std::expected<std::future<TransferResult>, Failure>
    fetch_async(TransferRequest request);

    // Blocks until the job resolves
    [[nodiscard]] TransferResult fetch(TransferRequest request);

private:
    queue::AdmissionQueue* queue_;
    core::Downloader* downloader_;
};

} // namespace ferry::service
