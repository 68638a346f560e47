#ifndef SPEEDWIRE_BOUNDED_QUEUE_HPP
#define SPEEDWIRE_BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace speedwire {

/**
 * @brief A thread-safe FIFO queue with a fixed capacity.
 *
 * Producers choose between a non-blocking `try_push` and a
 * blocking `push`. The overflow policy of `try_push` is drop-newest: when the
 * queue is full the offered element is discarded and the queue is left
 * untouched. Consumers block in `pop`/`pop_for` until an element arrives or
 * the queue is closed.
 *
 * After `close()` no element is accepted any more; elements already queued
 * can still be popped.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Adds an element if there is room for it.
     *
     * This method is thread-safe and never blocks.
     *
     * @param value The element to add to the queue.
     * @return bool False if the queue is full or closed; the element is dropped.
     */
    bool try_push(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(value);
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Adds an element, waiting for room if the queue is full.
     *
     * @param value The element to add to the queue.
     * @return bool False if the queue was closed before the element could be added.
     */
    bool push(const T& value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            queue_.push_back(value);
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Removes and returns the front element, waiting until one is available.
     *
     * @return std::optional<T> The front element, or std::nullopt once the queue is closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return take_front(lock);
    }

    /**
     * @brief Like pop(), but gives up after \p timeout.
     *
     * @return std::optional<T> The front element, or std::nullopt on timeout or close.
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
        return take_front(lock);
    }

    /**
     * @brief Removes and returns the front element, if available.
     *
     * This method is thread-safe and non-blocking.
     */
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return take_front(lock);
    }

    /**
     * @brief Closes the queue and wakes every waiting producer and consumer.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    std::optional<T> take_front(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_{false};
};

} // namespace speedwire

#endif // SPEEDWIRE_BOUNDED_QUEUE_HPP
