#pragma once

#include "chunkflow/core/units.hpp"
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/memory/memory_stats.hpp"
#include "chunkflow/transfer/integrity.hpp"
#include "chunkflow/transfer/retry.hpp"
#include "chunkflow/transfer/single_flight.hpp"
#include "chunkflow/transfer/transport.hpp"
#include "chunkflow/transfer/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkflow::transfer {

struct SchedulerOptions {
    std::uint64_t large_threshold_bytes = 100 * kMiB;
    int max_workers = 3;
    /// Concurrency figure handed to the chunk advisor.
    int chunk_streams = 5;
    /// Fixed chunk size; nullopt asks the advisor per item.
    std::optional<std::uint64_t> chunk_size_bytes;
    RetryPolicy retry;
    bool validate = true;
    DigestAlgorithm digest = DigestAlgorithm::Md5;
};

/**
 * @brief Runs a batch of transfers: small items in parallel, large items one by one
 *
 * Items below the threshold go through a pool of min(max_workers, count)
 * threads; the rest run afterwards on the calling thread, each holding the
 * single-flight gate. Both partitions are processed smallest first. Every
 * item yields exactly one outcome and no failure stops the run.
 */
class TransferScheduler {
public:
    TransferScheduler(Transport& transport,
                      const memory::MemoryStatsProvider& memory,
                      SchedulerOptions options = {},
                      events::EventBus* bus = nullptr);

    TransferReport run(std::vector<TransferItem> items);

    /// Same as run(items) with the threshold and pool size overridden for this call.
    TransferReport run(std::vector<TransferItem> items, std::uint64_t large_threshold_bytes, int max_workers);

    [[nodiscard]] const SchedulerOptions& options() const noexcept { return options_; }

private:
    TransferOutcome transfer_one(const TransferItem& item, bool large);
    std::uint64_t plan_chunk_size(const TransferItem& item) const;
    ValidationResult validate_remote(const TransferItem& item, const std::string& local_hash);
    void finish_outcome(TransferOutcome& outcome);

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    // Keeps two items with the same destination from running at once.
    void claim_destination(const std::string& destination);
    void release_destination(const std::string& destination);

    Transport& transport_;
    const memory::MemoryStatsProvider& memory_;
    SchedulerOptions options_;
    events::EventBus* bus_;

    RetryingTransport retrying_;
    IntegrityValidator validator_;
    SingleFlightGate large_gate_{1};

    std::mutex destinations_mutex_;
    std::condition_variable destinations_cv_;
    std::set<std::string> active_destinations_;
};

} // namespace chunkflow::transfer
