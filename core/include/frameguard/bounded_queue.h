#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace frameguard {

// BoundedQueue
// - Thread-safe FIFO with a fixed capacity
// - try_push never blocks; a full (or shut down) queue refuses the item
// - capacity counts items nobody is waiting for: a consumer blocked in pop()
//   takes an item on top of it, so capacity 0 is a pure hand-off
// - Blocking pop with shutdown(); items already queued are still drained
//
// Intent: admission control for the worker pool. A refused push is reported
// to the caller as Overloaded, never dropped silently.

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    // Returns false when full or shut down; `value` is left untouched then.
    bool try_push(T& value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || q_.size() >= capacity_ + waiting_) return false;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return true;
    }

    // Returns false once shut down and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        waiting_++;
        idle_cv_.notify_all();
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        waiting_--;
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
        idle_cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

    // Blocks until n consumers wait in pop(), or the queue is shut down.
    void wait_for_consumers(size_t n) {
        std::unique_lock<std::mutex> lk(mu_);
        idle_cv_.wait(lk, [&]{ return closed_ || waiting_ >= n; });
    }

    // Consumers currently blocked in pop().
    size_t waiting() const {
        std::lock_guard<std::mutex> lk(mu_);
        return waiting_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<T> q_;
    size_t waiting_{0};
    bool closed_{false};
};

} // namespace frameguard
