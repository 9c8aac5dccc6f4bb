#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <atomic>
#include <cstdint>
#include <mutex>

namespace lnc {

struct MetricsSnapshot {
    uint64_t totalScheduled = 0;
    uint64_t totalCancelled = 0;
    uint64_t totalErrors = 0;
    uint64_t poolHits = 0;
    uint64_t poolMisses = 0;
    uint64_t queueDrops = 0;
    uint64_t saveCount = 0;
    double averageSaveTimeMs = 0.0;
    QDateTime startTime;
    int64_t currentMemoryBytes = 0;
    int64_t peakMemoryBytes = 0;

    double poolHitRate() const
    {
        uint64_t total = poolHits + poolMisses;
        return total == 0 ? 0.0 : static_cast<double>(poolHits) / static_cast<double>(total);
    }

    QJsonObject toJson() const;
};

/**
 * Counters for the notification core.
 *
 * The increment*() calls are lock-free (relaxed atomics) and safe from any
 * thread. flush() folds the pending counts into the snapshot under a lock;
 * snapshot() flushes first, so readers always see every increment made
 * before the call.
 */
class Metrics {
public:
    Metrics();

    void incrementScheduled(uint64_t n = 1) { scheduled_.fetch_add(n, std::memory_order_relaxed); }
    void incrementCancelled(uint64_t n = 1) { cancelled_.fetch_add(n, std::memory_order_relaxed); }
    void incrementErrors() { errors_.fetch_add(1, std::memory_order_relaxed); }
    void incrementPoolHits() { poolHits_.fetch_add(1, std::memory_order_relaxed); }
    void incrementPoolMisses() { poolMisses_.fetch_add(1, std::memory_order_relaxed); }
    void incrementQueueDrops() { queueDrops_.fetch_add(1, std::memory_order_relaxed); }

    void recordSaveTime(double ms);

    /// Fold pending atomic counts and sample process memory.
    void flush();
    MetricsSnapshot snapshot();
    void reset();

    /// Write the current snapshot as JSON. Returns false on I/O failure.
    bool exportToFile(const QString& path);

private:
    static int64_t residentMemoryBytes();

    std::atomic<uint64_t> scheduled_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> poolHits_{0};
    std::atomic<uint64_t> poolMisses_{0};
    std::atomic<uint64_t> queueDrops_{0};

    std::mutex mutex_;
    MetricsSnapshot data_;
    double totalSaveMs_ = 0.0;
};

} // namespace lnc
