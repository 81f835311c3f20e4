#pragma once

// ============================================================
// admission_gate.hpp -- FIFO counting semaphore for bundle work
// ============================================================

#include "../common/platform.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

class AdmissionGate {
public:
    explicit AdmissionGate(size_t slots);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot is free and every earlier waiter has been
    // served. Returns false if `cancel` became true while queued.
    bool acquire(const std::atomic<bool>& cancel);

    void release();

    size_t capacity() const { return capacity_; }
    size_t in_use() const;
    size_t waiting() const;

    // RAII slot holder
    class Slot {
    public:
        Slot(AdmissionGate& gate, const std::atomic<bool>& cancel)
            : gate_(gate), held_(gate.acquire(cancel)) {}
        ~Slot() { if (held_) gate_.release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool held() const { return held_; }

    private:
        AdmissionGate& gate_;
        bool held_;
    };

private:
    const size_t            capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    size_t                  in_use_{0};
    u64                     next_ticket_{0};
    std::deque<u64>         queue_;  // tickets in arrival order
};
