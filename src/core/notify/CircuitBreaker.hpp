#pragma once

#include <chrono>
#include <functional>
#include <mutex>

namespace lnc {

/**
 * Consecutive-failure guard.
 *
 * Opens on the threshold-th failure in a row. Once open it stays open until
 * tick() observes that the cool-down has passed since it opened; then it
 * closes and the failure count starts again from zero. Any success resets
 * the count. Uses a monotonic clock, replaceable for tests.
 */
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr int kDefaultThreshold = 5;
    static constexpr int kDefaultCooldownMs = 60000;

    explicit CircuitBreaker(int threshold = kDefaultThreshold,
                            std::chrono::milliseconds cooldown = std::chrono::milliseconds(kDefaultCooldownMs),
                            Clock clock = {});

    /// Returns true if this failure opened the circuit.
    bool recordFailure();
    void recordSuccess();

    /// Returns true if the circuit closed during this call.
    bool tick();

    bool isOpen() const;
    int consecutiveFailures() const;
    int threshold() const { return threshold_; }
    std::chrono::milliseconds cooldown() const { return cooldown_; }

    void reset();

private:
    const int threshold_;
    const std::chrono::milliseconds cooldown_;
    Clock clock_;

    mutable std::mutex mutex_;
    int failures_ = 0;
    bool open_ = false;
    std::chrono::steady_clock::time_point openedAt_;
};

} // namespace lnc
