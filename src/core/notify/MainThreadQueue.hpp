#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace lnc {

class Metrics;

/**
 * Bounded FIFO of actions posted from any thread and executed by the owner
 * thread in drain().
 *
 * drain() pops small batches under the lock and runs them with the lock
 * released, so an action may enqueue further actions. It stops once
 * maxCount actions have run or the time budget is spent (checked after each
 * batch). An action that throws is logged and counted; the rest still run.
 */
class MainThreadQueue {
public:
    using Action = std::function<void()>;

    enum class OverflowPolicy {
        DropOldest,  // make room by discarding the head
        Reject       // leave the queue as is and report failure
    };

    static constexpr int kDefaultCapacity = 1024;
    static constexpr int kDefaultMaxActionsPerDrain = 128;
    static constexpr int kDefaultTimeBudgetMs = 2;
    static constexpr int kBatchSize = 16;

    explicit MainThreadQueue(int capacity = kDefaultCapacity, Metrics* metrics = nullptr);

    /// Returns false if the action was not queued (null action, or full under Reject).
    bool enqueue(Action action, OverflowPolicy policy = OverflowPolicy::DropOldest);

    /// Returns the number of actions executed. A negative budget disables the time check.
    int drain(int maxCount = kDefaultMaxActionsPerDrain, int budgetMs = kDefaultTimeBudgetMs);

    int size() const;
    int capacity() const { return capacity_; }
    uint64_t dropCount() const { return drops_.load(std::memory_order_relaxed); }
    uint64_t failureCount() const { return failures_.load(std::memory_order_relaxed); }
    void clear();

private:
    const int capacity_;
    Metrics* metrics_;

    mutable std::mutex mutex_;
    std::deque<Action> actions_;

    std::atomic<uint64_t> drops_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace lnc
