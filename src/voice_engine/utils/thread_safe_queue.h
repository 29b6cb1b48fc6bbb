/**
 * @file thread_safe_queue.h
 * @brief The channel type that connects voice workers.
 * @details Track commands, mixer and core messages, scheduler events and UDP transmit all
 *          travel over a `ThreadSafeQueue`. Calling `stop()` closes the channel: senders see
 *          `push` fail, receivers drain what is already buffered and then see closure.
 *          A failed push is how each worker learns its peer has gone away.
 */
#ifndef VOICELINK_THREAD_SAFE_QUEUE_H
#define VOICELINK_THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace voicelink {
namespace voice {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief Unbounded multi-producer, multi-consumer channel with close semantics.
 * @tparam T Message type; must be movable.
 */
template <typename T>
class ThreadSafeQueue {
public:
    /** @brief Outcome of `pop_for`. */
    enum class PopResult {
        Popped,
        TimedOut,
        Closed   ///< Stopped and fully drained.
    };

    ThreadSafeQueue() = default;

    // Shared between threads through shared_ptr only.
    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Sends a message.
     * @return false if the channel is closed; the message is dropped.
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until a message arrives or the channel is closed and empty.
     * @return false only on closure.
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front(item);
    }

    /**
     * @brief Like `pop`, but gives up after `timeout`.
     * Buffered messages are still delivered after `stop()`.
     */
    template <typename Rep, typename Period>
    PopResult pop_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (take_front(item)) {
            return PopResult::Popped;
        }
        return closed_ ? PopResult::Closed : PopResult::TimedOut;
    }

    /** @brief Non-blocking receive, used by the tick-driven workers to drain their inbox. */
    bool try_pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front(item);
    }

    /** @brief Closes the channel and wakes every waiter. */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    /** @brief Closes the channel and drops whatever is still queued. */
    void stop_and_clear() {
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            dropped.swap(items_);
        }
        ready_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool is_stopped() const { return closed_; }

private:
    // Caller holds mutex_.
    bool take_front(T& item) {
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    std::atomic<bool> closed_{false};
};

} // namespace utils
} // namespace voice
} // namespace voicelink

#endif // VOICELINK_THREAD_SAFE_QUEUE_H
