#pragma once

#include "chunkflow/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkflow::memory {

struct MemoryStats {
    std::uint64_t available_bytes = 0;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Source of physical memory figures for chunk sizing
 *
 * Implementations may fail (missing /proc, sandboxed process); callers
 * treat a failure as "unknown" and fall back to fixed defaults.
 */
class MemoryStatsProvider {
public:
    virtual ~MemoryStatsProvider() = default;

    virtual Result<MemoryStats> read() const = 0;
};

/**
 * @brief Reads the host's memory figures
 *
 * Linux: MemAvailable/MemTotal from /proc/meminfo, falling back to
 * sysinfo(2) when the file cannot be parsed. macOS: hw.memsize for the
 * total and free plus inactive VM pages for the available figure.
 * Windows: GlobalMemoryStatusEx.
 */
class SystemMemoryStats : public MemoryStatsProvider {
public:
    SystemMemoryStats() = default;

    /// Reads a meminfo-formatted file instead of /proc/meminfo.
    explicit SystemMemoryStats(std::filesystem::path meminfo_path);

    Result<MemoryStats> read() const override;

private:
    std::filesystem::path meminfo_path_{"/proc/meminfo"};
};

/// Fixed figures, or a fixed failure, for deterministic sizing.
class FixedMemoryStats : public MemoryStatsProvider {
public:
    FixedMemoryStats(std::uint64_t available_bytes, std::uint64_t total_bytes);

    static FixedMemoryStats failing(std::string reason);

    Result<MemoryStats> read() const override;

private:
    FixedMemoryStats() = default;

    MemoryStats stats_;
    std::string failure_;
};

/// Available memory from VM page counts, capped at the total.
MemoryStats from_vm_pages(std::uint64_t total_bytes,
                          std::uint64_t free_pages,
                          std::uint64_t inactive_pages,
                          std::uint64_t page_size);

/// Parses "MemTotal:  16314664 kB"-style content.
Result<MemoryStats> parse_meminfo(const std::string& content);

} // namespace chunkflow::memory
