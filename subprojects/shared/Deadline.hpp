#ifndef SPEEDWIRE_DEADLINE_HPP
#define SPEEDWIRE_DEADLINE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace speedwire {

/**
 * @brief Cancellation signal that also fires on its own once a time limit passes.
 *
 * A single Deadline is created per bounded operation and shared by every task
 * of that operation. It is done when either the time limit elapsed or
 * `cancel()` was called, whichever comes first, and never becomes undone.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(Clock::duration timeout) : at_(Clock::now() + timeout) {}

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    /** @brief Fire the signal early and wake every waiter. */
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    bool expired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_ || Clock::now() >= at_;
    }

    /**
     * @brief Sleep for at most \p interval, returning early if the deadline fires.
     * @return true if the deadline has fired.
     */
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> interval) const {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto wake = (std::min)(at_, Clock::now() + std::chrono::duration_cast<Clock::duration>(interval));
        cv_.wait_until(lock, wake, [this]() { return cancelled_; });
        return cancelled_ || Clock::now() >= at_;
    }

    /** @brief Block until the deadline fires. */
    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, at_, [this]() { return cancelled_; });
    }

    Clock::duration remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return Clock::duration::zero();
        const auto now = Clock::now();
        return now >= at_ ? Clock::duration::zero() : at_ - now;
    }

    Clock::time_point at() const { return at_; }

private:
    const Clock::time_point at_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_{false};
};

} // namespace speedwire

#endif // SPEEDWIRE_DEADLINE_HPP
