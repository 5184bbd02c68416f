#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace chunkflow::transfer {

struct ProgressState {
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
};

/**
 * @brief Byte counter for one item (or one archive run)
 *
 * advance() may be called from several threads streaming parts of the same
 * item. finish() releases the tracker exactly once; later calls and the
 * destructor are no-ops. The listener sees a snapshot each time progress
 * crosses a whole percent, and once more on finish().
 */
class ProgressTracker {
public:
    using Listener = std::function<void(const std::string& label, const ProgressState&)>;

    ProgressTracker(std::string label, std::uint64_t total_bytes, Listener listener = {});
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void advance(std::uint64_t bytes);

    /// Drops progress made by a failed attempt before the item is re-read.
    void reset();

    void finish();

    [[nodiscard]] ProgressState state() const;
    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    std::string label_;
    std::uint64_t total_bytes_;
    Listener listener_;

    mutable std::mutex mutex_;
    std::uint64_t transferred_ = 0;
    int last_percent_ = -1;
    std::chrono::steady_clock::time_point started_at_;
    std::atomic<bool> finished_{false};
};

} // namespace chunkflow::transfer
