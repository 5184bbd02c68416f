#include "chunkflow/transfer/progress.hpp"

#include "chunkflow/core/units.hpp"

#include <spdlog/spdlog.h>

namespace chunkflow::transfer {
namespace {

int percent_of(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    return static_cast<int>((done * 100) / total);
}

} // namespace

ProgressTracker::ProgressTracker(std::string label, std::uint64_t total_bytes, Listener listener)
    : label_(std::move(label)),
      total_bytes_(total_bytes),
      listener_(std::move(listener)),
      started_at_(std::chrono::steady_clock::now()) {}

ProgressTracker::~ProgressTracker() {
    finish();
}

void ProgressTracker::advance(std::uint64_t bytes) {
    if (bytes == 0 || finished_.load()) {
        return;
    }

    ProgressState snapshot;
    bool notify = false;
    {
        std::lock_guard lock(mutex_);
        transferred_ += bytes;
        const int percent = percent_of(transferred_, total_bytes_);
        if (percent != last_percent_) {
            last_percent_ = percent;
            notify = static_cast<bool>(listener_);
        }
        snapshot = ProgressState{total_bytes_, transferred_};
    }

    if (notify) {
        listener_(label_, snapshot);
    }
}

void ProgressTracker::reset() {
    std::lock_guard lock(mutex_);
    transferred_ = 0;
    last_percent_ = -1;
}

void ProgressTracker::finish() {
    if (finished_.exchange(true)) {
        return;
    }

    const auto snapshot = state();
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
    const double rate = elapsed > 0.0 ? to_mib(snapshot.transferred_bytes) / elapsed : 0.0;
    spdlog::debug("{}: {} of {} bytes in {:.2f}s ({:.2f} MB/s average)",
                  label_, snapshot.transferred_bytes, snapshot.total_bytes, elapsed, rate);

    if (listener_) {
        listener_(label_, snapshot);
    }
}

ProgressState ProgressTracker::state() const {
    std::lock_guard lock(mutex_);
    return ProgressState{total_bytes_, transferred_};
}

} // namespace chunkflow::transfer
