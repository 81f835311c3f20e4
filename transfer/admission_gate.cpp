// ============================================================
// admission_gate.cpp
// ============================================================

#include "admission_gate.hpp"
#include <algorithm>
#include <chrono>

// Waiters re-check their cancel flag at this period
static constexpr int CANCEL_POLL_MS = 50;

AdmissionGate::AdmissionGate(size_t slots)
    : capacity_(slots == 0 ? 1 : slots) {}

bool AdmissionGate::acquire(const std::atomic<bool>& cancel) {
    std::unique_lock<std::mutex> lk(mutex_);
    u64 ticket = next_ticket_++;
    queue_.push_back(ticket);

    while (true) {
        if (cancel.load()) {
            queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
            lk.unlock();
            cv_.notify_all();
            return false;
        }
        if (queue_.front() == ticket && in_use_ < capacity_) {
            queue_.pop_front();
            ++in_use_;
            lk.unlock();
            // The next ticket may fit into a remaining slot
            cv_.notify_all();
            return true;
        }
        cv_.wait_for(lk, std::chrono::milliseconds(CANCEL_POLL_MS));
    }
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_all();
}

size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return in_use_;
}

size_t AdmissionGate::waiting() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queue_.size();
}
