#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace tandem {

// ---------------------------------------------------------------------------
// Fixed-capacity multi-producer channel between feed threads and the
// coordinator.
//
// push() blocks while the channel is full and returns false once it is
// closed. Consumers never block on try_pop()/drain(); wait_for() parks the
// consumer until data arrives, the channel closes or the timeout passes.
// close() wakes every waiter; items already queued stay drainable.
// ---------------------------------------------------------------------------
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bool push(T value) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    // Moves up to max items into out; returns how many were moved.
    std::size_t drain(std::vector<T>& out, std::size_t max) {
        std::unique_lock<std::mutex> lock(mtx_);
        std::size_t n = 0;
        while (n < max && !queue_.empty()) {
            out.push_back(std::move(queue_.front()));
            queue_.pop_front();
            ++n;
        }
        lock.unlock();
        if (n > 0) not_full_.notify_all();
        return n;
    }

    // True if data is available when it returns.
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return !queue_.empty();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<T> queue_;
    bool closed_{false};

    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

}
