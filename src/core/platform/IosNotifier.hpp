#pragma once

#include "core/platform/LocalTimerNotifier.hpp"
#include <QList>
#include <functional>

namespace lnc {

/**
 * iOS flavour. Notifications are keyed by identifier, so the handle is a
 * stable hash of it and rescheduling an identifier replaces the pending one.
 * Only daily and weekly repeats exist (calendar triggers); anything else
 * that repeats is refused. Keeps the application badge.
 */
class IosNotifier : public LocalTimerNotifier {
    Q_OBJECT
public:
    static constexpr int kMaxPending = 64;

    using PermissionPrompt = std::function<bool()>;

    explicit IosNotifier(bool autoIncrementBadge = true, QObject* parent = nullptr);

    QString platformName() const override { return QStringLiteral("iOS"); }
    int maxPending() const override { return kMaxPending; }

    bool checkPermission() override { return authorized_; }
    void requestPermission(PermissionCallback callback) override;
    void cancelAllDisplayed() override;

    void setPermissionPrompt(PermissionPrompt prompt) { prompt_ = std::move(prompt); }

    int badgeCount() const { return badge_; }
    void setBadgeCount(int count) { badge_ = count < 0 ? 0 : count; }

    static PlatformHandle handleForIdentifier(const QString& identifier);

protected:
    PlatformHandle assignHandle(const NotificationRequest& request) override;
    void prepare(NotificationRequest& request, const QString& channelId) override;
    void onDelivered(const NotificationRequest& request) override;

private:
    bool autoIncrementBadge_;
    bool authorized_ = false;
    bool requestInFlight_ = false;
    QList<PermissionCallback> permissionWaiters_;
    int badge_ = 0;
    PermissionPrompt prompt_;
};

} // namespace lnc
