#pragma once

#include "core/platform/IPlatformNotifier.hpp"
#include <QHash>
#include <QList>

namespace lnc {

/// Records calls without delivering anything. Used on unsupported hosts and in tests.
class NullNotifier : public IPlatformNotifier {
public:
    explicit NullNotifier(int maxPending = 500);

    QString platformName() const override { return QStringLiteral("Null"); }
    int maxPending() const override { return maxPending_; }

    PlatformHandle schedule(const NotificationRequest& request, const QString& channelId) override;
    void cancel(PlatformHandle handle, const QString& identifier) override;
    void cancelAllScheduled() override;
    void cancelAllDisplayed() override;

    bool checkPermission() override { return permission_; }
    void requestPermission(PermissionCallback callback) override;

    NotificationStatus status(PlatformHandle handle) const override;
    void setEventCallback(EventCallback callback) override { eventCallback_ = std::move(callback); }

    // Test controls
    void setFailing(bool failing) { failing_ = failing; }
    void setDeclining(bool declining) { declining_ = declining; }
    void setPermission(bool granted) { permission_ = granted; }
    void setMaxPending(int n) { maxPending_ = n; }
    void setStatus(PlatformHandle handle, NotificationStatus status) { statuses_[handle] = status; }
    void simulateEvent(const NotificationEvent& event);

    int scheduleCalls() const { return scheduleCalls_; }
    int cancelCalls() const { return cancelCalls_; }
    int cancelAllScheduledCalls() const { return cancelAllScheduledCalls_; }
    int cancelAllDisplayedCalls() const { return cancelAllDisplayedCalls_; }
    QList<PlatformHandle> cancelledHandles() const { return cancelled_; }
    QList<NotificationRequest> scheduled() const { return scheduled_; }
    int pendingCount() const { return static_cast<int>(statuses_.size()); }

private:
    int maxPending_;
    bool failing_ = false;
    bool declining_ = false;
    bool permission_ = true;
    PlatformHandle nextHandle_ = 1;

    int scheduleCalls_ = 0;
    int cancelCalls_ = 0;
    int cancelAllScheduledCalls_ = 0;
    int cancelAllDisplayedCalls_ = 0;
    QList<PlatformHandle> cancelled_;
    QList<NotificationRequest> scheduled_;
    QHash<PlatformHandle, NotificationStatus> statuses_;
    EventCallback eventCallback_;
};

} // namespace lnc
