#ifndef BLOCKING_QUEUE_H
#define BLOCKING_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>


/**
 * This class implements a FIFO queue with built-in thread-safe blocking
 * properties on its push / pop methods.
 */
template <typename T>
class BlockingQueue
{
private:
    std::mutex              d_mutex;
    std::condition_variable d_condition;
    std::deque<T>           d_queue;

    T pop_front_locked() {
        T rc(std::move(d_queue.front()));
        d_queue.pop_front();
        return rc;
    }

public:
    /* add a new value to the queue and notify a waiting thread. */
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(d_mutex);
            d_queue.push_back(std::move(value));
        }
        d_condition.notify_one();
    }

    /**
     * Wait indefinitely until the queue is non-empty and then pop and return
     * the oldest value.
     */
    T waitingPop() {
        std::unique_lock<std::mutex> lock(d_mutex);
        d_condition.wait(lock, [this] { return !d_queue.empty(); });
        return pop_front_locked();
    }

    /**
     * Wait until the first ocurrence of 1. the queue is non-empty, or 2. the
     * timeout duration expires. If the duration expires, a null option is
     * returned. Otherwise, the oldest value is popped and returned.
     */
    std::optional<T> waitingPop_timed(int timeout_ms) {
        std::unique_lock<std::mutex> lock(d_mutex);
        if (!d_condition.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                [this] { return !d_queue.empty(); })) {
            return std::nullopt;
        }
        return pop_front_locked();
    }
};

#endif /* !BLOCKING_QUEUE_H */
