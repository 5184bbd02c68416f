/**
 * @file events.hpp
 * @brief Events published by transfer runs and archive builds
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: TransferCompleted, ArchiveFailed.
 * They are emitted on the thread that did the work.
 */

#pragma once

#include "chunkflow/core/error.hpp"
#include "chunkflow/transfer/integrity.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkflow::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief A worker (or the large-item path) picked up an item
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent
 */
struct TransferStarted {
    std::string destination;
    std::uint64_t size_bytes = 0;
    std::uint64_t chunk_size_bytes = 0;
    bool large = false;
};

/// One attempt failed; a retry may follow.
struct AttemptFailed {
    std::string destination;
    int attempt = 0;
    int status_code = 0;
    std::string error;
};

/// Percent-step progress of one item or archive.
struct ProgressUpdated {
    std::string label;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Item transferred and validated
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (one info line)
 * - MetricsComponent (files/bytes/attempt counters)
 */
struct TransferCompleted {
    std::string destination;
    std::uint64_t size_bytes = 0;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
    transfer::ValidationStrength validation = transfer::ValidationStrength::None;
};

struct TransferFailed {
    std::string destination;
    ErrorKind kind = ErrorKind::TransportExhausted;
    int attempts = 0;
    std::string error;
};

// ════════════════════════════════════════════════════════
// Archive Events
// ════════════════════════════════════════════════════════

struct ArchiveEntryWritten {
    std::string relative_path;
    std::uint64_t size_bytes = 0;
    std::uint64_t stored_bytes = 0;
    int attempts = 1;
};

struct ArchiveCompleted {
    std::filesystem::path container;
    std::size_t entries = 0;
    std::uint64_t source_bytes = 0;
    std::uint64_t container_bytes = 0;
    std::chrono::milliseconds elapsed{0};
};

struct ArchiveFailed {
    std::filesystem::path container;
    ErrorKind kind = ErrorKind::IoError;
    std::string error;
};

} // namespace chunkflow::events
