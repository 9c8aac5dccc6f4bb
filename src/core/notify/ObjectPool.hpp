#pragma once

#include "core/notify/Metrics.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace lnc {

/**
 * Bounded free-list of reusable objects.
 *
 * acquire() hands out a pooled object when one is available (a hit) or
 * allocates a fresh one (a miss). release() calls T::reset() and keeps the
 * object only while the pool holds fewer than capacity objects; extras are
 * freed. Thread-safe.
 */
template <typename T>
class ObjectPool {
public:
    explicit ObjectPool(size_t capacity, Metrics* metrics = nullptr)
        : capacity_(capacity)
        , metrics_(metrics)
    {
        free_.reserve(capacity_);
    }

    std::unique_ptr<T> acquire()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!free_.empty()) {
                auto obj = std::move(free_.back());
                free_.pop_back();
                ++hits_;
                if (metrics_) metrics_->incrementPoolHits();
                return obj;
            }
            ++misses_;
        }
        if (metrics_) metrics_->incrementPoolMisses();
        return std::make_unique<T>();
    }

    void release(std::unique_ptr<T> obj)
    {
        if (!obj) return;
        obj->reset();

        std::lock_guard<std::mutex> lock(mutex_);
        if (free_.size() < capacity_)
            free_.push_back(std::move(obj));
    }

    size_t available() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return free_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t hits() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    const size_t capacity_;
    Metrics* metrics_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<T>> free_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace lnc
