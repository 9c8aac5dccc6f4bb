#pragma once

#include "core/platform/LocalTimerNotifier.hpp"
#include <QList>
#include <functional>

namespace lnc {

struct AndroidChannelConfig {
    QString id = QStringLiteral("default_channel");
    QString name = QStringLiteral("Default Channel");
    QString description = QStringLiteral("Default notification channel");
    QString importance = QStringLiteral("high");
    bool enableVibration = true;
    bool enableLights = true;
    bool showBadge = true;
    bool canBypassDnd = false;
};

/**
 * Android flavour: increasing integer ids (seeded from the clock so they do
 * not collide with handles persisted by an earlier run), a single registered channel and
 * the POST_NOTIFICATIONS runtime permission, which only exists from SDK 33.
 * Below that level notifications are always allowed.
 *
 * Without permission schedule() declines with a negative handle. Android
 * has no custom repeat period; such requests are delivered once.
 */
class AndroidNotifier : public LocalTimerNotifier {
    Q_OBJECT
public:
    static constexpr int kMaxPending = 500;
    static constexpr int kPermissionSdkLevel = 33;

    /// Stands in for the system permission dialog. Returns the user's answer.
    using PermissionPrompt = std::function<bool()>;

    explicit AndroidNotifier(AndroidChannelConfig channel = {}, int sdkLevel = kPermissionSdkLevel,
                             QObject* parent = nullptr);

    QString platformName() const override { return QStringLiteral("Android"); }
    int maxPending() const override { return kMaxPending; }

    bool checkPermission() override;
    void requestPermission(PermissionCallback callback) override;

    void setPermissionPrompt(PermissionPrompt prompt) { prompt_ = std::move(prompt); }
    const AndroidChannelConfig& channel() const { return channel_; }
    int sdkLevel() const { return sdkLevel_; }

protected:
    PlatformHandle assignHandle(const NotificationRequest& request) override;
    void prepare(NotificationRequest& request, const QString& channelId) override;

private:
    bool permissionRequired() const { return sdkLevel_ >= kPermissionSdkLevel; }

    AndroidChannelConfig channel_;
    int sdkLevel_;
    bool granted_ = false;
    bool requestInFlight_ = false;
    QList<PermissionCallback> permissionWaiters_;
    PermissionPrompt prompt_;
    PlatformHandle nextId_;
};

} // namespace lnc
