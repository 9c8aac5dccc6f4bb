#include "core/platform/NullNotifier.hpp"

namespace lnc {

NullNotifier::NullNotifier(int maxPending) : maxPending_(maxPending) {}

PlatformHandle NullNotifier::schedule(const NotificationRequest& request, const QString&)
{
    ++scheduleCalls_;
    if (failing_)
        throw PlatformError("simulated platform failure");
    if (declining_)
        return kInvalidHandle;

    PlatformHandle handle = nextHandle_++;
    scheduled_.append(request);
    statuses_.insert(handle, NotificationStatus::Scheduled);
    return handle;
}

void NullNotifier::cancel(PlatformHandle handle, const QString&)
{
    ++cancelCalls_;
    if (failing_)
        throw PlatformError("simulated platform failure");
    cancelled_.append(handle);
    statuses_.remove(handle);
}

void NullNotifier::cancelAllScheduled()
{
    ++cancelAllScheduledCalls_;
    statuses_.clear();
}

void NullNotifier::cancelAllDisplayed()
{
    ++cancelAllDisplayedCalls_;
}

void NullNotifier::requestPermission(PermissionCallback callback)
{
    if (callback)
        callback(permission_);
}

NotificationStatus NullNotifier::status(PlatformHandle handle) const
{
    return statuses_.value(handle, NotificationStatus::Unavailable);
}

void NullNotifier::simulateEvent(const NotificationEvent& event)
{
    if (eventCallback_)
        eventCallback_(event);
}

} // namespace lnc
