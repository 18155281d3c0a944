#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace mcpforge {

// ConcurrentPriorityQueue
// - Thread-safe push/pop, FIFO within one priority
// - Lower priority value => popped first
// - shutdown() refuses new items; consumers drain what is queued, then pop returns false

template <typename T>
class ConcurrentPriorityQueue {
public:
    struct Item {
        int32_t priority{0};
        uint64_t seq{0};
        T value;
    };

private:
    struct Cmp {
        bool operator()(const Item& a, const Item& b) const {
            // std::priority_queue pops the "largest" element; invert so lower priority comes first.
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

public:
    ConcurrentPriorityQueue() = default;

    // Returns false (item dropped) after shutdown.
    bool push(int32_t priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push(Item{priority, seq_++, std::move(value)});
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false when shut down and empty.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        return take_locked(out);
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

private:
    bool take_locked(Item& out) {
        if (q_.empty()) return false;
        out = q_.top();  // copy (const ref from priority_queue::top)
        q_.pop();
        return true;
    }

    std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Cmp> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace mcpforge
