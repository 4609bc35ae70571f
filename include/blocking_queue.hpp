#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

// Bounded FIFO used as a backpressure point between producers and consumers.
// put/take block until they succeed; offer/poll give up after a timeout.
// Shared by all producers and consumers through std::shared_ptr.
template <typename T>
class BlockingQueue {
public:
    // Throws std::invalid_argument for capacity 0 (such a queue could never accept a put).
    explicit BlockingQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("BlockingQueue: capacity must be positive");
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // Blocks while full, then appends at the tail.
    void put(T item) {
        std::unique_lock<std::mutex> lk(m_);
        cv_not_full_.wait(lk, [&]{ return q_.size() < capacity_; });
        q_.push_back(std::move(item));
        lk.unlock();
        cv_not_empty_.notify_one();
    }

    // Blocks while empty, then removes the head.
    T take() {
        std::unique_lock<std::mutex> lk(m_);
        cv_not_empty_.wait(lk, [&]{ return !q_.empty(); });
        T item = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        cv_not_full_.notify_one();
        return item;
    }

    // Like put(), but returns false (item not inserted) if no room frees up
    // before the timeout. A zero timeout still checks once.
    template <typename Rep, typename Period>
    bool offer(T item, const std::chrono::duration<Rep, Period>& timeout) {
        const auto deadline = deadline_after(timeout);
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_not_full_.wait_until(lk, deadline, [&]{ return q_.size() < capacity_; }))
            return false;
        q_.push_back(std::move(item));
        lk.unlock();
        cv_not_empty_.notify_one();
        return true;
    }

    // Like take(), but returns nullopt if nothing arrives before the timeout.
    template <typename Rep, typename Period>
    std::optional<T> poll(const std::chrono::duration<Rep, Period>& timeout) {
        const auto deadline = deadline_after(timeout);
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_not_empty_.wait_until(lk, deadline, [&]{ return !q_.empty(); }))
            return std::nullopt;
        std::optional<T> item(std::move(q_.front()));
        q_.pop_front();
        lk.unlock();
        cv_not_full_.notify_one();
        return item;
    }

    // Diagnostics; size()/empty() are stale as soon as they return.
    size_t capacity() const { return capacity_; }

    size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.empty();
    }

private:
    using Clock = std::chrono::steady_clock;

    // Negative timeouts behave like zero; very large ones saturate instead of overflowing.
    template <typename Rep, typename Period>
    static Clock::time_point deadline_after(const std::chrono::duration<Rep, Period>& timeout) {
        const auto now = Clock::now();
        if (timeout <= timeout.zero()) return now;
        const auto room = Clock::time_point::max() - now;
        if (std::chrono::duration_cast<std::chrono::duration<double>>(timeout) >=
            std::chrono::duration_cast<std::chrono::duration<double>>(room))
            return Clock::time_point::max();
        return now + std::chrono::duration_cast<Clock::duration>(timeout);
    }

    const size_t capacity_;
    std::deque<T> q_;
    mutable std::mutex m_;
    // Split wake signal: producers wait on not_full, consumers on not_empty, so
    // a notify_one always reaches a waiter that can act on the state change.
    std::condition_variable cv_not_empty_, cv_not_full_;
};

template <typename T>
std::shared_ptr<BlockingQueue<T>> make_blocking_queue(size_t capacity) {
    return std::make_shared<BlockingQueue<T>>(capacity);
}
