#pragma once

// ============================================================
// sequence_tracker.hpp -- Per-sender duplicate / replay filter
// ============================================================

#include "platform.hpp"
#include <unordered_map>
#include <mutex>

// Accepts a (sender, seq) pair only when seq is above the last accepted
// value for that sender. Gaps are tolerated.
class SequenceTracker {
public:
    bool accept(u64 sender, u64 seq) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = last_.find(sender);
        if (it != last_.end() && seq <= it->second) return false;
        last_[sender] = seq;
        return true;
    }

    u64 last(u64 sender) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = last_.find(sender);
        return it == last_.end() ? 0 : it->second;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mutex_);
        last_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<u64, u64> last_;
};
