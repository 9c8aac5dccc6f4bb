#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QtGlobal>

namespace lnc {

/// Opaque handle returned by a platform notifier for a scheduled notification.
using PlatformHandle = qint64;
constexpr PlatformHandle kInvalidHandle = -1;

/// Longest accepted fire delay: one year.
constexpr qint64 kMaxFireDelaySeconds = 365LL * 24 * 60 * 60;

enum class RepeatInterval {
    None,
    Daily,
    Weekly,
    Custom
};

QString repeatIntervalToString(RepeatInterval interval);
RepeatInterval repeatIntervalFromString(const QString& name);

struct NotificationRequest {
    QString title;
    QString body;
    QString subtitle;
    qint64 fireDelaySeconds = 0;
    QString identifier;         // empty = generated on schedule
    QString smallIcon = QStringLiteral("icon_0");
    QString largeIcon = QStringLiteral("icon_1");
    QString soundName = QStringLiteral("default");
    QString groupKey;
    bool repeats = false;
    RepeatInterval repeatInterval = RepeatInterval::None;
    qint64 repeatIntervalSeconds = 0;  // only used with RepeatInterval::Custom
    int badgeCount = -1;               // -1 = leave badge alone

    bool isValid() const
    {
        return !title.isEmpty() && !body.isEmpty() && fireDelaySeconds >= 0;
    }

    /// Period between repeats in seconds, 0 when the request does not repeat.
    qint64 repeatPeriodSeconds() const;

    void reset() { *this = NotificationRequest{}; }
};

struct ReturnNotificationConfig {
    bool enabled = true;
    QString title = QStringLiteral("We miss you!");
    QString body = QStringLiteral("Come back and claim your rewards!");
    int hoursBeforeNotification = 24;
    bool repeating = false;
    RepeatInterval repeatInterval = RepeatInterval::Daily;
    QString identifier = QStringLiteral("return_notification");

    QJsonObject toJson() const;
    static ReturnNotificationConfig fromJson(const QJsonObject& obj);

    bool operator==(const ReturnNotificationConfig& o) const
    {
        return enabled == o.enabled && title == o.title && body == o.body
            && hoursBeforeNotification == o.hoursBeforeNotification
            && repeating == o.repeating && repeatInterval == o.repeatInterval
            && identifier == o.identifier;
    }
};

struct NotificationEvent {
    enum class Type {
        Received,
        Tapped,
        PermissionGranted,
        PermissionDenied,
        Error
    };

    Type type = Type::Received;
    QString title;
    QString body;
    QString error;
    QDateTime timestamp;

    void reset() { *this = NotificationEvent{}; }
};

QString eventTypeToString(NotificationEvent::Type type);

} // namespace lnc
