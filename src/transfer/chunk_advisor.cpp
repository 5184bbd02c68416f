#include "chunkflow/transfer/chunk_advisor.hpp"

#include "chunkflow/core/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkflow::transfer {

std::uint64_t ChunkSizeAdvisor::clamp(std::uint64_t chunk_size) noexcept {
    return std::clamp(chunk_size, kMinChunkSize, kMaxChunkSize);
}

std::uint64_t ChunkSizeAdvisor::advise(std::uint64_t available_bytes,
                                       std::uint64_t total_bytes,
                                       int concurrent_streams) noexcept {
    const std::uint64_t streams = concurrent_streams > 0 ? static_cast<std::uint64_t>(concurrent_streams) : 1;

    long double usable = static_cast<long double>(available_bytes);
    const long double floor_share = static_cast<long double>(total_bytes) * 0.10L;
    if (usable < floor_share) {
        usable = floor_share;
    }

    usable *= 0.80L;
    const long double per_stream = usable / static_cast<long double>(streams);
    auto candidate = static_cast<std::uint64_t>(per_stream * 0.25L);

    candidate = (candidate / kMiB) * kMiB;
    return clamp(candidate);
}

std::uint64_t ChunkSizeAdvisor::advise_for_item(std::uint64_t available_bytes,
                                                std::uint64_t total_bytes,
                                                int concurrent_streams,
                                                std::uint64_t item_size) noexcept {
    return apply_item_floor(advise(available_bytes, total_bytes, concurrent_streams), item_size);
}

std::uint64_t ChunkSizeAdvisor::apply_item_floor(std::uint64_t chunk, std::uint64_t item_size) noexcept {
    if (item_size >= kHugeItemThreshold) {
        chunk = std::max(chunk, kHugeItemFloor);
    } else if (item_size >= kBigItemThreshold) {
        chunk = std::max(chunk, kBigItemFloor);
    }
    return clamp(chunk);
}

std::uint64_t ChunkSizeAdvisor::advise(const memory::MemoryStatsProvider& provider,
                                       int concurrent_streams) {
    auto stats = provider.read();
    if (stats.is_error()) {
        spdlog::warn("[{}] {}; using default chunk size of {:.1f} MB",
                     to_string(ErrorKind::MemoryStatsUnavailable), stats.error(), to_mib(kDefaultChunkSize));
        return kDefaultChunkSize;
    }

    const auto chunk = advise(stats.value().available_bytes, stats.value().total_bytes, concurrent_streams);
    spdlog::debug("Advised chunk size {:.1f} MB from {:.1f} MB available / {:.1f} MB total across {} streams",
                  to_mib(chunk), to_mib(stats.value().available_bytes), to_mib(stats.value().total_bytes),
                  concurrent_streams);
    return chunk;
}

std::uint64_t ChunkSizeAdvisor::advise_for_item(const memory::MemoryStatsProvider& provider,
                                                int concurrent_streams,
                                                std::uint64_t item_size) {
    return apply_item_floor(advise(provider, concurrent_streams), item_size);
}

} // namespace chunkflow::transfer
