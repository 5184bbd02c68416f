#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace chunkflow::transfer {

/**
 * @brief Counting gate that admits at most `capacity` holders
 *
 * Used with capacity 1 to serialize large items against each other. It
 * guards a class of work, not a piece of data: holders share nothing
 * through it.
 */
class SingleFlightGate {
public:
    explicit SingleFlightGate(std::size_t capacity = 1) : available_(capacity == 0 ? 1 : capacity) {}

    SingleFlightGate(const SingleFlightGate&) = delete;
    SingleFlightGate& operator=(const SingleFlightGate&) = delete;

    void acquire() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return available_ > 0; });
        --available_;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            ++available_;
        }
        cv_.notify_one();
    }

    /// RAII holder; releases on scope exit.
    class Ticket {
    public:
        explicit Ticket(SingleFlightGate& gate) : gate_(gate) { gate_.acquire(); }
        ~Ticket() { gate_.release(); }

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

    private:
        SingleFlightGate& gate_;
    };

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t available_;
};

} // namespace chunkflow::transfer
