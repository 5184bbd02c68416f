/**
 * @file components.hpp
 * @brief Observers that turn engine events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * scheduler.run(...);
 * metrics.print_stats();
 */

#pragma once

#include "chunkflow/core/units.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkflow::events {

/**
 * @brief Logs every transfer and archive event through spdlog
 *
 * Progress is logged at debug level only; everything else at info,
 * warn or error depending on severity.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStarted>([this](const TransferStarted& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<AttemptFailed>([this](const AttemptFailed& e) {
            on_attempt_failed(e);
        });

        bus_.subscribe<ProgressUpdated>([this](const ProgressUpdated& e) {
            on_progress(e);
        });

        bus_.subscribe<TransferCompleted>([this](const TransferCompleted& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailed>([this](const TransferFailed& e) {
            on_transfer_failed(e);
        });

        bus_.subscribe<ArchiveEntryWritten>([this](const ArchiveEntryWritten& e) {
            on_archive_entry(e);
        });

        bus_.subscribe<ArchiveCompleted>([this](const ArchiveCompleted& e) {
            on_archive_completed(e);
        });

        bus_.subscribe<ArchiveFailed>([this](const ArchiveFailed& e) {
            on_archive_failed(e);
        });
    }

private:
    void on_transfer_started(const TransferStarted& e) {
        spdlog::info("[TransferStarted] dest={} size={:.2f}MB chunk={}KB{}",
                     e.destination, to_mib(e.size_bytes), e.chunk_size_bytes / kKiB,
                     e.large ? " (large, single-flight)" : "");
    }

    void on_attempt_failed(const AttemptFailed& e) {
        spdlog::warn("[AttemptFailed] dest={} attempt={} status={} error={}",
                     e.destination, e.attempt, e.status_code, e.error);
    }

    void on_progress(const ProgressUpdated& e) {
        const double percent = e.total_bytes == 0
            ? 100.0
            : 100.0 * static_cast<double>(e.transferred_bytes) / static_cast<double>(e.total_bytes);
        spdlog::debug("[Progress] {} {:.0f}% ({}/{} bytes)", e.label, percent, e.transferred_bytes, e.total_bytes);
    }

    void on_transfer_completed(const TransferCompleted& e) {
        spdlog::info("[TransferCompleted] dest={} size={} attempts={} duration={}ms validation={}",
                     e.destination, e.size_bytes, e.attempts, e.elapsed.count(),
                     transfer::to_string(e.validation));
    }

    void on_transfer_failed(const TransferFailed& e) {
        spdlog::error("[TransferFailed] dest={} kind={} attempts={} error={}",
                      e.destination, to_string(e.kind), e.attempts, e.error);
    }

    void on_archive_entry(const ArchiveEntryWritten& e) {
        spdlog::debug("[ArchiveEntry] path={} size={} stored={} attempts={}",
                      e.relative_path, e.size_bytes, e.stored_bytes, e.attempts);
    }

    void on_archive_completed(const ArchiveCompleted& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Archive created: {}", e.container.string());
        spdlog::info("  Entries:   {}", e.entries);
        spdlog::info("  Source:    {:.2f} MB", to_mib(e.source_bytes));
        spdlog::info("  Archive:   {:.2f} MB", to_mib(e.container_bytes));
        spdlog::info("  Duration:  {:.2f}s", static_cast<double>(e.elapsed.count()) / 1000.0);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_archive_failed(const ArchiveFailed& e) {
        spdlog::error("[ArchiveFailed] container={} kind={} error={}",
                      e.container.string(), to_string(e.kind), e.error);
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfers, retries and archive work for the run summary
 *
 * Counters are atomics because events arrive from every worker thread.
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_started{0};
        std::atomic<uint64_t> files_transferred{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> failed_attempts{0};
        std::atomic<uint64_t> archive_entries{0};
        std::atomic<uint64_t> archive_bytes{0};
        std::atomic<uint64_t> archives_built{0};
        std::atomic<uint64_t> archives_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStarted>([this](const TransferStarted&) {
            stats_.files_started++;
        });

        bus_.subscribe<AttemptFailed>([this](const AttemptFailed&) {
            stats_.failed_attempts++;
        });

        bus_.subscribe<TransferCompleted>([this](const TransferCompleted& e) {
            stats_.files_transferred++;
            stats_.bytes_transferred += e.size_bytes;
        });

        bus_.subscribe<TransferFailed>([this](const TransferFailed&) {
            stats_.files_failed++;
        });

        bus_.subscribe<ArchiveEntryWritten>([this](const ArchiveEntryWritten& e) {
            stats_.archive_entries++;
            stats_.archive_bytes += e.size_bytes;
        });

        bus_.subscribe<ArchiveCompleted>([this](const ArchiveCompleted&) {
            stats_.archives_built++;
        });

        bus_.subscribe<ArchiveFailed>([this](const ArchiveFailed&) {
            stats_.archives_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Run Statistics:");
        spdlog::info("  Files started:     {}", stats_.files_started.load());
        spdlog::info("  Files transferred: {}", stats_.files_transferred.load());
        spdlog::info("  Bytes transferred: {}", stats_.bytes_transferred.load());
        spdlog::info("  Files failed:      {}", stats_.files_failed.load());
        spdlog::info("  Failed attempts:   {}", stats_.failed_attempts.load());
        if (stats_.archives_built.load() + stats_.archives_failed.load() > 0) {
            spdlog::info("  Archive entries:   {}", stats_.archive_entries.load());
            spdlog::info("  Archive bytes:     {}", stats_.archive_bytes.load());
            spdlog::info("  Archives built:    {}", stats_.archives_built.load());
            spdlog::info("  Archives failed:   {}", stats_.archives_failed.load());
        }
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunkflow::events
