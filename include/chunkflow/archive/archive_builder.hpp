#pragma once

#include "chunkflow/archive/zip_writer.hpp"
#include "chunkflow/core/error.hpp"
#include "chunkflow/core/result.hpp"
#include "chunkflow/core/units.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/memory/memory_stats.hpp"
#include "chunkflow/transfer/chunk_stream.hpp"
#include "chunkflow/transfer/retry.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::archive {

struct ArchiveOptions {
    bool compress = false;
    int compression_level = -1;  ///< DEFLATE level 0-9; -1 keeps libarchive's default
    bool validate = true;
    /// Entries below this size are read whole; larger ones are streamed.
    std::uint64_t in_memory_threshold = 10 * kMiB;
    int entry_attempts = 3;
    std::chrono::duration<double> entry_retry_delay{1.0};
    transfer::Sleeper sleeper;
    /// Opens entry sources; empty reads the file directly.
    transfer::SourceOpener open_source;
    /// Fixed read size for streamed entries; nullopt asks the advisor per entry.
    std::optional<std::uint64_t> chunk_size_bytes;
    int chunk_streams = 1;
};

struct ArchiveEntry {
    std::string relative_path;
    std::uint64_t size_bytes = 0;
    bool compressed = false;
};

struct SizeMismatch {
    std::string relative_path;
    std::uint64_t source_size = 0;
    std::uint64_t archived_size = 0;
};

/// Discrepancies between the source tree and a finished container.
struct ArchiveValidation {
    bool performed = false;
    std::size_t checked = 0;
    std::vector<std::string> missing;
    std::vector<SizeMismatch> size_mismatches;

    [[nodiscard]] bool passed() const { return missing.empty() && size_mismatches.empty(); }

    /// First @p limit entries of each list, for log lines.
    [[nodiscard]] std::string preview(std::size_t limit = 5) const;
};

struct ArchiveResult {
    bool succeeded = false;
    std::filesystem::path container;
    std::optional<ErrorKind> error_kind;
    std::string error;
    std::string failed_entry;
    std::vector<ArchiveEntry> entries;
    std::uint64_t source_bytes = 0;
    std::uint64_t container_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    ArchiveValidation validation;
};

/**
 * @brief Packs files into one ZIP64 container with bounded memory
 *
 * Entries are written smallest first. Small entries are read whole; the
 * rest go through a ChunkStream one chunk at a time. An entry whose source
 * cannot be opened or read is retried from its first byte with a flat
 * delay. Bytes already in the container are re-read and must hash to what
 * was written; the retry then carries on where the container left off.
 * Once the attempts run out, on a size mismatch, or when the re-read
 * prefix differs, the whole build fails and the partial container is
 * deleted.
 */
class StreamingArchiveBuilder {
public:
    StreamingArchiveBuilder(const memory::MemoryStatsProvider& memory,
                            ArchiveOptions options = {},
                            events::EventBus* bus = nullptr);

    ArchiveResult build(const std::filesystem::path& source_root,
                        const std::vector<std::string>& entries,
                        const std::filesystem::path& destination);

    /**
     * @brief Re-walk the source tree and compare it with the container's directory
     *
     * Every requested entry, and every file collect_entries() now finds
     * under @p source_root, must be present with its current source size.
     */
    ArchiveValidation validate(const std::filesystem::path& source_root,
                               const std::vector<std::string>& entries,
                               const std::filesystem::path& container) const;

    /**
     * @brief Regular files under @p source_root, relative, with '/' separators
     *
     * Existing .zip files and @p exclude (usually the container being
     * built) are skipped.
     */
    static Result<std::vector<std::string>> collect_entries(const std::filesystem::path& source_root,
                                                            const std::filesystem::path& exclude = {});

    [[nodiscard]] const ArchiveOptions& options() const noexcept { return options_; }

private:
    struct PlannedEntry {
        std::string name;
        std::filesystem::path source;
        std::uint64_t size = 0;
        std::time_t modified = 0;
    };

    /// @p committed_digest is the MD5 of the entry bytes already in the container.
    Result<void, ZipError> write_entry(ZipWriter& writer, const PlannedEntry& entry, std::string& committed_digest);
    ArchiveResult fail(ArchiveResult result, ErrorKind kind, std::string error);
    void sleep(std::chrono::duration<double> delay) const;

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    const memory::MemoryStatsProvider& memory_;
    ArchiveOptions options_;
    events::EventBus* bus_;
};

} // namespace chunkflow::archive
