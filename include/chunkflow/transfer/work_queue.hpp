/**
 * @file work_queue.hpp
 * @brief Thread-safe FIFO shared by the scheduler's workers
 *
 * EXAMPLE:
 * WorkQueue<TransferItem> queue;
 * queue.push(item);             // scheduler
 * queue.shutdown();             // no more items
 * WorkerPool<TransferItem> pool(queue);
 * pool.spawn(3, [](TransferItem& item) { ... });
 * pool.join();
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace chunkflow::transfer {

/**
 * @brief Multi-producer multi-consumer queue
 *
 * pop() blocks until an item arrives or shutdown() is called; after
 * shutdown the remaining items are still drained before pop() returns
 * nullopt.
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Wakes every blocked pop().
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

/**
 * @brief Threads draining one WorkQueue
 *
 * The destructor shuts the queue down and joins every started thread, so
 * an exception thrown while spawning (std::system_error from std::thread)
 * or anywhere else in the owning scope never leaves a joinable thread
 * behind.
 */
template<typename T>
class WorkerPool {
public:
    explicit WorkerPool(WorkQueue<T>& queue) : queue_(queue) {}

    ~WorkerPool() {
        queue_.shutdown();
        join();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Starts @p count threads that call @p handler for each popped item.
    template<typename Handler>
    void spawn(std::size_t count, Handler handler) {
        threads_.reserve(threads_.size() + count);
        for (std::size_t i = 0; i < count; ++i) {
            threads_.emplace_back([this, handler]() mutable {
                while (auto item = queue_.pop()) {
                    handler(*item);
                }
            });
        }
    }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    WorkQueue<T>& queue_;
    std::vector<std::thread> threads_;
};

} // namespace chunkflow::transfer
