#ifndef NON_BLOCKING_THREAD_SAFE_QUEUE_HPP
#define NON_BLOCKING_THREAD_SAFE_QUEUE_HPP

#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>
#include <utility>

/**
 * @brief An unbounded, non-blocking, thread-safe FIFO queue.
 *
 * Any number of producers may push concurrently; a single consumer takes
 * elements with `tryPop` or `drain`. One mutex guards the buffer, so elements
 * pushed by one producer are always observed in the order they were pushed.
 * No consumer operation ever waits for elements to arrive.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T>
class NonBlockingThreadSafeQueue {
public:
    NonBlockingThreadSafeQueue() = default;

    NonBlockingThreadSafeQueue(const NonBlockingThreadSafeQueue&) = delete;
    NonBlockingThreadSafeQueue& operator=(const NonBlockingThreadSafeQueue&) = delete;

    /**
     * @brief Adds an element to the back of the queue.
     *
     * @param value The element to add to the queue.
     */
    void push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(value));
    }

    /**
     * @brief Removes and returns the front element of the queue, if available.
     *
     * @return std::optional<T> The front element, or std::nullopt if the queue is empty.
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * @brief Removes every element currently buffered and returns them in FIFO order.
     *
     * Elements pushed after the swap stay queued for the next call.
     */
    std::vector<T> drain() {
        std::deque<T> taken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            taken.swap(queue_);
        }
        return std::vector<T>(std::make_move_iterator(taken.begin()),
                              std::make_move_iterator(taken.end()));
    }

    /// Discards every buffered element.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
};

#endif // NON_BLOCKING_THREAD_SAFE_QUEUE_HPP
