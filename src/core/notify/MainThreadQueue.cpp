#include "core/notify/MainThreadQueue.hpp"
#include "core/notify/Metrics.hpp"
#include <QElapsedTimer>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <exception>
#include <vector>

namespace lnc {

MainThreadQueue::MainThreadQueue(int capacity, Metrics* metrics)
    : capacity_(capacity > 0 ? capacity : 1)
    , metrics_(metrics)
{
}

bool MainThreadQueue::enqueue(Action action, OverflowPolicy policy)
{
    if (!action)
        return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(actions_.size()) < capacity_) {
            actions_.push_back(std::move(action));
            return true;
        }
        if (policy == OverflowPolicy::Reject)
            return false;

        actions_.pop_front();
        actions_.push_back(std::move(action));
    }

    drops_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_)
        metrics_->incrementQueueDrops();
    BOOST_LOG_TRIVIAL(warning) << "[MainThreadQueue] Queue full (" << capacity_
                               << "), dropped oldest action";
    return true;
}

int MainThreadQueue::drain(int maxCount, int budgetMs)
{
    if (maxCount <= 0)
        return 0;

    QElapsedTimer timer;
    timer.start();

    int executed = 0;
    std::vector<Action> batch;
    batch.reserve(kBatchSize);

    while (executed < maxCount) {
        batch.clear();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int take = std::min({kBatchSize, maxCount - executed, static_cast<int>(actions_.size())});
            for (int i = 0; i < take; ++i) {
                batch.push_back(std::move(actions_.front()));
                actions_.pop_front();
            }
        }
        if (batch.empty())
            break;

        for (auto& action : batch) {
            try {
                action();
            } catch (const std::exception& e) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                if (metrics_)
                    metrics_->incrementErrors();
                BOOST_LOG_TRIVIAL(error) << "[MainThreadQueue] Action failed: " << e.what();
            } catch (...) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                if (metrics_)
                    metrics_->incrementErrors();
                BOOST_LOG_TRIVIAL(error) << "[MainThreadQueue] Action failed with a non-standard exception";
            }
            ++executed;
        }

        if (budgetMs >= 0 && timer.elapsed() >= budgetMs)
            break;
    }

    return executed;
}

int MainThreadQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(actions_.size());
}

void MainThreadQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    actions_.clear();
}

} // namespace lnc
