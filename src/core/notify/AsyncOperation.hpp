#pragma once

#include "core/notify/MainThreadQueue.hpp"
#include <QString>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace lnc {

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class OperationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The service is shut down or not initialized.
class ServiceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QueueFullError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

template <typename T>
std::future<T> makeFailedFuture(std::exception_ptr error)
{
    std::promise<T> p;
    p.set_exception(error);
    return p.get_future();
}

namespace detail {

template <typename T>
struct MainThreadCall {
    std::promise<T> promise;
    std::atomic<bool> claimed{false};   // started on the main thread, or abandoned by the caller
    std::atomic<bool> settled{false};   // promise already satisfied
};

constexpr auto kPollSlice = std::chrono::milliseconds(10);

} // namespace detail

/// One-shot completion handle given to work started on the main thread.
/// Later calls after the first are ignored.
template <typename T>
class Completion {
public:
    explicit Completion(std::shared_ptr<detail::MainThreadCall<T>> call) : call_(std::move(call)) {}

    template <typename... V>
    void operator()(V&&... value) const
    {
        if (!call_->settled.exchange(true))
            call_->promise.set_value(std::forward<V>(value)...);
    }

    void fail(std::exception_ptr error) const
    {
        if (!call_->settled.exchange(true))
            call_->promise.set_exception(error);
    }

private:
    std::shared_ptr<detail::MainThreadCall<T>> call_;
};

/**
 * Start work on the thread that drains queue; the work reports back through
 * the Completion it is given, now or later.
 *
 * The deadline starts now. get() on the returned future waits in short
 * slices until the result arrives, the token is cancelled (OperationCancelled)
 * or the deadline passes (TimeoutError). Work that has not started by then
 * is skipped; a result that arrives after the caller left is dropped.
 * A full queue yields a future that throws QueueFullError.
 *
 * Never call get() on the draining thread: it would wait out the timeout.
 */
template <typename T>
std::future<T> startOnMainThread(MainThreadQueue& queue,
                                 std::function<void(Completion<T>)> work,
                                 std::chrono::milliseconds timeout,
                                 CancellationToken token,
                                 const QString& operation)
{
    const std::string opName = operation.toStdString();
    if (token.isCancelled())
        return makeFailedFuture<T>(std::make_exception_ptr(OperationCancelled(opName + " cancelled")));

    auto call = std::make_shared<detail::MainThreadCall<T>>();
    std::future<T> result = call->promise.get_future();

    bool queued = queue.enqueue([call, work = std::move(work), token]() {
        if (token.isCancelled() || call->claimed.exchange(true))
            return;
        Completion<T> done(call);
        try {
            work(done);
        } catch (...) {
            done.fail(std::current_exception());
        }
    }, MainThreadQueue::OverflowPolicy::Reject);

    if (!queued)
        return makeFailedFuture<T>(std::make_exception_ptr(QueueFullError(opName + ": main thread queue is full")));

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    return std::async(std::launch::deferred,
                      [call, result = std::move(result), token, deadline, opName]() mutable -> T {
        for (;;) {
            if (result.wait_for(detail::kPollSlice) == std::future_status::ready)
                return result.get();

            if (token.isCancelled()) {
                call->claimed.store(true);
                throw OperationCancelled(opName + " cancelled");
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                call->claimed.store(true);
                throw TimeoutError(opName + " timed out");
            }
        }
    });
}

/// Run fn on the draining thread and return its result (or exception) as a future.
template <typename T>
std::future<T> runOnMainThread(MainThreadQueue& queue,
                               std::function<T()> fn,
                               std::chrono::milliseconds timeout,
                               CancellationToken token,
                               const QString& operation)
{
    return startOnMainThread<T>(queue, [fn = std::move(fn)](Completion<T> done) {
        if constexpr (std::is_void_v<T>) {
            fn();
            done();
        } else {
            done(fn());
        }
    }, timeout, std::move(token), operation);
}

} // namespace lnc
