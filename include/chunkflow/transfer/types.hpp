#pragma once

#include "chunkflow/core/error.hpp"
#include "chunkflow/transfer/integrity.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::transfer {

struct TransferItem {
    std::filesystem::path source_path;
    std::string destination_path;
    std::uint64_t size_bytes = 0;
};

struct ChunkPlan {
    std::uint64_t chunk_size_bytes = 0;
};

struct TransferOutcome {
    TransferItem item;
    bool succeeded = false;
    int attempts = 0;
    std::optional<ErrorKind> error_kind;
    std::chrono::milliseconds elapsed{0};
    ValidationResult validation;
    std::string last_error;
    int last_status = 0;
};

/**
 * @brief All outcomes of one scheduler run
 *
 * Outcomes are stored in completion order; look them up by destination
 * rather than relying on position.
 */
struct TransferReport {
    std::vector<TransferOutcome> outcomes;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] const TransferOutcome* find(const std::string& destination) const {
        for (const auto& outcome : outcomes) {
            if (outcome.item.destination_path == destination) {
                return &outcome;
            }
        }
        return nullptr;
    }

    [[nodiscard]] std::size_t succeeded_count() const {
        std::size_t count = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.succeeded) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] std::size_t failed_count() const { return outcomes.size() - succeeded_count(); }
    [[nodiscard]] bool all_succeeded() const { return failed_count() == 0; }

    [[nodiscard]] std::uint64_t bytes_transferred() const {
        std::uint64_t total = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.succeeded) {
                total += outcome.item.size_bytes;
            }
        }
        return total;
    }
};

} // namespace chunkflow::transfer
