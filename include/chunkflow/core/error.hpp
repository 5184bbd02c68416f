#pragma once

#include <optional>
#include <string>

namespace chunkflow {

/**
 * @brief Failure classification shared by transfers and archive builds
 *
 * Per-item kinds (NotFound, TransportExhausted, TransportRejected,
 * ValidationFailed) end up in a TransferOutcome and never abort a run.
 * ArchiveEntryCorrupt and IoError abort an archive build as a whole.
 * MemoryStatsUnavailable is only ever logged: the advisor falls back.
 */
enum class ErrorKind {
    NotFound,
    TransportExhausted,
    TransportRejected,
    ValidationFailed,
    MemoryStatsUnavailable,
    ArchiveEntryCorrupt,
    IoError
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::TransportExhausted: return "TransportExhausted";
        case ErrorKind::TransportRejected: return "TransportRejected";
        case ErrorKind::ValidationFailed: return "ValidationFailed";
        case ErrorKind::MemoryStatsUnavailable: return "MemoryStatsUnavailable";
        case ErrorKind::ArchiveEntryCorrupt: return "ArchiveEntryCorrupt";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

inline std::string to_string(const std::optional<ErrorKind>& kind) {
    return kind ? to_string(*kind) : std::string("none");
}

} // namespace chunkflow
