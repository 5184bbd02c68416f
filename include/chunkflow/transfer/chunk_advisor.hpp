#pragma once

#include "chunkflow/core/units.hpp"
#include "chunkflow/memory/memory_stats.hpp"

#include <cstdint>

namespace chunkflow::transfer {

/**
 * @brief Picks a per-stream chunk size from the memory the host can spare
 *
 * usable = available, or 10% of total when available drops below that;
 * 20% of usable is reserved, the rest is split across the concurrent
 * streams and a quarter of each share becomes the chunk. The result is
 * rounded down to whole MiB and clamped to [kMinChunkSize, kMaxChunkSize].
 */
class ChunkSizeAdvisor {
public:
    static constexpr std::uint64_t kMinChunkSize = 1 * kMiB;
    static constexpr std::uint64_t kMaxChunkSize = 64 * kMiB;
    static constexpr std::uint64_t kDefaultChunkSize = 4 * kMiB;

    static constexpr std::uint64_t kHugeItemThreshold = 1 * kGiB;
    static constexpr std::uint64_t kHugeItemFloor = 16 * kMiB;
    static constexpr std::uint64_t kBigItemThreshold = 100 * kMiB;
    static constexpr std::uint64_t kBigItemFloor = 4 * kMiB;

    [[nodiscard]] static std::uint64_t advise(std::uint64_t available_bytes,
                                              std::uint64_t total_bytes,
                                              int concurrent_streams) noexcept;

    /// Same as advise() with the floor raised for items >= 100 MiB and >= 1 GiB.
    [[nodiscard]] static std::uint64_t advise_for_item(std::uint64_t available_bytes,
                                                       std::uint64_t total_bytes,
                                                       int concurrent_streams,
                                                       std::uint64_t item_size) noexcept;

    /// Reads the provider; on failure logs and returns kDefaultChunkSize.
    [[nodiscard]] static std::uint64_t advise(const memory::MemoryStatsProvider& provider,
                                              int concurrent_streams);

    [[nodiscard]] static std::uint64_t advise_for_item(const memory::MemoryStatsProvider& provider,
                                                       int concurrent_streams,
                                                       std::uint64_t item_size);

    [[nodiscard]] static std::uint64_t clamp(std::uint64_t chunk_size) noexcept;

private:
    static std::uint64_t apply_item_floor(std::uint64_t chunk, std::uint64_t item_size) noexcept;
};

} // namespace chunkflow::transfer
