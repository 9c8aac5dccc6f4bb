#pragma once

#include "core/notify/NotificationTypes.hpp"
#include <QString>
#include <functional>
#include <stdexcept>

namespace lnc {

enum class NotificationStatus {
    Unknown,
    Scheduled,
    Delivered,
    Unavailable
};

QString notificationStatusToString(NotificationStatus status);

/// Thrown by a notifier when the platform refuses or fails an operation.
class PlatformError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Seam to the OS notification facility.
 *
 * All calls are made from the service's owner thread. Implementations may
 * throw PlatformError; the service catches and counts it.
 */
class IPlatformNotifier {
public:
    using EventCallback = std::function<void(const NotificationEvent&)>;
    using PermissionCallback = std::function<void(bool granted)>;

    virtual ~IPlatformNotifier() = default;

    virtual QString platformName() const = 0;

    /// Most notifications the OS keeps pending at once.
    virtual int maxPending() const = 0;

    /// Returns the platform handle, or a negative value if the request was declined.
    virtual PlatformHandle schedule(const NotificationRequest& request, const QString& channelId) = 0;

    virtual void cancel(PlatformHandle handle, const QString& identifier) = 0;
    virtual void cancelAllScheduled() = 0;
    virtual void cancelAllDisplayed() = 0;

    virtual bool checkPermission() = 0;
    /// Callback is invoked on the owner thread, possibly before this returns.
    virtual void requestPermission(PermissionCallback callback) = 0;

    virtual NotificationStatus status(PlatformHandle handle) const = 0;

    /// Delivery and interaction events (Received, Tapped).
    virtual void setEventCallback(EventCallback callback) = 0;
};

} // namespace lnc
