#include "core/notify/CircuitBreaker.hpp"
#include <boost/log/trivial.hpp>

namespace lnc {

CircuitBreaker::CircuitBreaker(int threshold, std::chrono::milliseconds cooldown, Clock clock)
    : threshold_(threshold > 0 ? threshold : 1)
    , cooldown_(cooldown)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
{
}

bool CircuitBreaker::recordFailure()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    if (open_ || failures_ < threshold_)
        return false;

    open_ = true;
    openedAt_ = clock_();
    BOOST_LOG_TRIVIAL(warning) << "[CircuitBreaker] Opened after " << failures_
                               << " consecutive failures, cooling down for "
                               << cooldown_.count() << "ms";
    return true;
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;
}

bool CircuitBreaker::tick()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_)
        return false;
    if (clock_() - openedAt_ < cooldown_)
        return false;

    open_ = false;
    failures_ = 0;
    BOOST_LOG_TRIVIAL(info) << "[CircuitBreaker] Cool-down elapsed, circuit closed";
    return true;
}

bool CircuitBreaker::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

int CircuitBreaker::consecutiveFailures() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void CircuitBreaker::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;
    open_ = false;
}

} // namespace lnc
