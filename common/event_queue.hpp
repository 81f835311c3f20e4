#pragma once

// ============================================================
// event_queue.hpp -- Blocking multi-producer / single-consumer queue
// ============================================================

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>

template<typename T>
class EventQueue {
public:
    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Returns false once the queue is closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Wait up to timeout_ms for one item. Returns false on timeout or
    // when the queue is closed and drained.
    bool pop_for(T& out, int timeout_ms) {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                     [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Re-open after close(); drops anything left over
    void reset() {
        std::lock_guard<std::mutex> lk(mutex_);
        items_.clear();
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<T>           items_;
    bool                    closed_{false};
};
