#include "chunkflow/transfer/scheduler.hpp"
#include "chunkflow/events/events.hpp"
#include "chunkflow/transfer/chunk_advisor.hpp"
#include "chunkflow/transfer/chunk_stream.hpp"
#include "chunkflow/transfer/progress.hpp"
#include "chunkflow/transfer/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace chunkflow::transfer {
namespace fs = std::filesystem;

namespace {

bool smaller_first(const TransferItem& a, const TransferItem& b) {
    if (a.size_bytes != b.size_bytes) {
        return a.size_bytes < b.size_bytes;
    }
    return a.destination_path < b.destination_path;
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TransferScheduler::TransferScheduler(Transport& transport,
                                     const memory::MemoryStatsProvider& memory,
                                     SchedulerOptions options,
                                     events::EventBus* bus)
    : transport_(transport),
      memory_(memory),
      options_(std::move(options)),
      bus_(bus),
      retrying_(options_.retry),
      validator_(options_.digest) {}

TransferReport TransferScheduler::run(std::vector<TransferItem> items) {
    return run(std::move(items), options_.large_threshold_bytes, options_.max_workers);
}

TransferReport TransferScheduler::run(std::vector<TransferItem> items,
                                      std::uint64_t large_threshold_bytes,
                                      int max_workers) {
    const auto started = std::chrono::steady_clock::now();

    std::vector<TransferItem> small;
    std::vector<TransferItem> large;
    for (auto& item : items) {
        if (item.size_bytes >= large_threshold_bytes) {
            large.push_back(std::move(item));
        } else {
            small.push_back(std::move(item));
        }
    }
    std::sort(small.begin(), small.end(), smaller_first);
    std::sort(large.begin(), large.end(), smaller_first);

    spdlog::info("Scheduling {} small and {} large items (threshold {:.2f} MB) to {}",
                 small.size(), large.size(), to_mib(large_threshold_bytes), transport_.describe());

    TransferReport report;
    std::mutex report_mutex;

    if (!small.empty()) {
        WorkQueue<TransferItem> queue;
        for (auto& item : small) {
            queue.push(std::move(item));
        }
        queue.shutdown();

        const std::size_t worker_count = std::min<std::size_t>(
            static_cast<std::size_t>(std::max(1, max_workers)), small.size());
        spdlog::info("Processing {} small items with {} workers", small.size(), worker_count);

        auto process = [this, &report, &report_mutex](TransferItem& item) {
            auto outcome = transfer_one(item, false);
            std::lock_guard lock(report_mutex);
            report.outcomes.push_back(std::move(outcome));
        };

        WorkerPool<TransferItem> pool(queue);
        try {
            pool.spawn(worker_count, process);
        } catch (const std::system_error& e) {
            spdlog::warn("Started {} of {} workers: {}", pool.size(), worker_count, e.what());
        }
        if (pool.size() == 0) {
            // No thread could be started: drain on the calling thread.
            while (auto item = queue.pop()) {
                process(*item);
            }
        }
        pool.join();
    }

    if (!large.empty()) {
        spdlog::info("Processing {} large items sequentially", large.size());
        for (const auto& item : large) {
            SingleFlightGate::Ticket ticket(large_gate_);
            report.outcomes.push_back(transfer_one(item, true));
        }
    }

    report.elapsed = since(started);
    spdlog::info("Transfer run finished: {} items, {} succeeded, {} failed, {:.2f} MB in {:.2f}s",
                 report.outcomes.size(), report.succeeded_count(), report.failed_count(),
                 to_mib(report.bytes_transferred()),
                 static_cast<double>(report.elapsed.count()) / 1000.0);
    return report;
}

std::uint64_t TransferScheduler::plan_chunk_size(const TransferItem& item) const {
    if (options_.chunk_size_bytes) {
        return ChunkSizeAdvisor::clamp(*options_.chunk_size_bytes);
    }
    return ChunkSizeAdvisor::advise_for_item(memory_, options_.chunk_streams, item.size_bytes);
}

void TransferScheduler::claim_destination(const std::string& destination) {
    std::unique_lock lock(destinations_mutex_);
    destinations_cv_.wait(lock, [this, &destination]() {
        return active_destinations_.count(destination) == 0;
    });
    active_destinations_.insert(destination);
}

void TransferScheduler::release_destination(const std::string& destination) {
    {
        std::lock_guard lock(destinations_mutex_);
        active_destinations_.erase(destination);
    }
    destinations_cv_.notify_all();
}

void TransferScheduler::finish_outcome(TransferOutcome& outcome) {
    if (outcome.succeeded) {
        publish(events::TransferCompleted{outcome.item.destination_path, outcome.item.size_bytes,
                                          outcome.attempts, outcome.elapsed, outcome.validation.strength});
        return;
    }
    publish(events::TransferFailed{outcome.item.destination_path,
                                   outcome.error_kind.value_or(ErrorKind::TransportExhausted),
                                   outcome.attempts, outcome.last_error});
}

TransferOutcome TransferScheduler::transfer_one(const TransferItem& item, bool large) {
    const auto started = std::chrono::steady_clock::now();
    TransferOutcome outcome;
    outcome.item = item;

    claim_destination(item.destination_path);
    struct DestinationRelease {
        TransferScheduler& self;
        const std::string& destination;
        ~DestinationRelease() { self.release_destination(destination); }
    } release{*this, item.destination_path};

    std::error_code ec;
    if (!fs::is_regular_file(item.source_path, ec)) {
        outcome.error_kind = ErrorKind::NotFound;
        outcome.last_error = "Source not found: " + item.source_path.string();
        outcome.elapsed = since(started);
        finish_outcome(outcome);
        return outcome;
    }

    const ChunkPlan plan{plan_chunk_size(item)};
    publish(events::TransferStarted{item.destination_path, item.size_bytes, plan.chunk_size_bytes, large});

    auto local_hash = validator_.digest_file(item.source_path);
    if (local_hash.is_error()) {
        outcome.error_kind = fs::exists(item.source_path, ec) ? ErrorKind::IoError : ErrorKind::NotFound;
        outcome.last_error = local_hash.error();
        outcome.elapsed = since(started);
        finish_outcome(outcome);
        return outcome;
    }

    HeaderMap headers{
        {"Content-Type", "application/octet-stream"},
        {checksum_header_name(options_.digest), local_hash.value()},
    };

    ProgressTracker progress(item.destination_path, item.size_bytes,
        [this](const std::string& label, const ProgressState& state) {
            publish(events::ProgressUpdated{label, state.transferred_bytes, state.total_bytes});
        });

    std::uint64_t streamed_bytes = 0;
    bool size_changed = false;
    auto retry = retrying_.attempt(item.destination_path, [&](AttemptContext& context) {
        auto attempt_headers = headers;
        if (context.checksum_deploy_fallback) {
            attempt_headers["X-Checksum-Deploy"] = "true";
        }

        ChunkStream stream(item.source_path, static_cast<std::size_t>(plan.chunk_size_bytes), &progress);
        AttemptResult result;
        if (auto opened = stream.open(); opened.is_error()) {
            result = AttemptResult::retryable(opened.error());
        } else {
            result = classify_response(
                transport_.put_stream(item.destination_path, stream, attempt_headers, item.size_bytes));
        }

        streamed_bytes = stream.bytes_read();
        if (streamed_bytes > item.size_bytes || (stream.exhausted() && streamed_bytes != item.size_bytes)) {
            // Re-reading a file that keeps changing cannot succeed; stop retrying.
            size_changed = true;
            result = AttemptResult::hard_failure(
                "source changed during transfer: recorded " + std::to_string(item.size_bytes) +
                " bytes, streamed " + std::to_string(streamed_bytes), result.status_code);
        }
        if (result.status != AttemptStatus::Success) {
            publish(events::AttemptFailed{item.destination_path, context.attempt + 1, result.status_code, result.error});
        }
        return result;
    }, &progress);
    progress.finish();

    outcome.attempts = retry.attempts;
    outcome.last_status = retry.last_status;
    outcome.last_error = retry.last_error;

    if (size_changed) {
        outcome.validation = {false, ValidationStrength::None, retry.last_error};
        outcome.error_kind = ErrorKind::ValidationFailed;
        outcome.elapsed = since(started);
        finish_outcome(outcome);
        return outcome;
    }

    if (!retry.succeeded()) {
        outcome.error_kind = retry.state == RetryState::Rejected
            ? ErrorKind::TransportRejected
            : ErrorKind::TransportExhausted;
        outcome.elapsed = since(started);
        finish_outcome(outcome);
        return outcome;
    }

    if (options_.validate) {
        outcome.validation = validate_remote(item, local_hash.value());
    } else {
        outcome.validation = {true, ValidationStrength::None, "validation disabled"};
    }

    outcome.succeeded = outcome.validation.passed;
    if (!outcome.succeeded) {
        outcome.error_kind = ErrorKind::ValidationFailed;
        outcome.last_error = outcome.validation.detail;
    }
    outcome.elapsed = since(started);
    finish_outcome(outcome);
    return outcome;
}

ValidationResult TransferScheduler::validate_remote(const TransferItem& item, const std::string& local_hash) {
    auto response = transport_.head(item.destination_path);
    if (response.is_error()) {
        return {false, ValidationStrength::None, "could not retrieve remote info: " + response.error()};
    }
    if (response.value().status_code != 200) {
        return {false, ValidationStrength::None,
                "could not retrieve remote info: HTTP " + std::to_string(response.value().status_code)};
    }

    const auto remote_size = response.value().content_length();
    if (!remote_size) {
        spdlog::warn("{}: remote did not report a size; assuming the transfer is intact", item.destination_path);
        return {true, ValidationStrength::None, "remote exposes no size"};
    }

    auto remote_hash = response.value().header(checksum_header_name(options_.digest));
    auto result = validator_.validate(item.size_bytes, local_hash, *remote_size, remote_hash);
    if (result.passed) {
        spdlog::debug("{}: validation {} ({})", item.destination_path, to_string(result.strength), result.detail);
    } else {
        spdlog::warn("{}: validation failed: {}", item.destination_path, result.detail);
    }
    return result;
}

} // namespace chunkflow::transfer
