#include "core/notify/NotificationTypes.hpp"

namespace lnc {

QString repeatIntervalToString(RepeatInterval interval)
{
    switch (interval) {
    case RepeatInterval::Daily: return QStringLiteral("daily");
    case RepeatInterval::Weekly: return QStringLiteral("weekly");
    case RepeatInterval::Custom: return QStringLiteral("custom");
    case RepeatInterval::None: break;
    }
    return QStringLiteral("none");
}

RepeatInterval repeatIntervalFromString(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("daily")) return RepeatInterval::Daily;
    if (n == QLatin1String("weekly")) return RepeatInterval::Weekly;
    if (n == QLatin1String("custom")) return RepeatInterval::Custom;
    return RepeatInterval::None;
}

qint64 NotificationRequest::repeatPeriodSeconds() const
{
    if (!repeats)
        return 0;

    switch (repeatInterval) {
    case RepeatInterval::Daily: return 24 * 60 * 60;
    case RepeatInterval::Weekly: return 7 * 24 * 60 * 60;
    case RepeatInterval::Custom: return repeatIntervalSeconds > 0 ? repeatIntervalSeconds : 0;
    case RepeatInterval::None: break;
    }
    return 0;
}

QJsonObject ReturnNotificationConfig::toJson() const
{
    QJsonObject obj;
    obj["enabled"] = enabled;
    obj["title"] = title;
    obj["body"] = body;
    obj["hoursBeforeNotification"] = hoursBeforeNotification;
    obj["repeating"] = repeating;
    obj["repeatInterval"] = repeatIntervalToString(repeatInterval);
    obj["identifier"] = identifier;
    return obj;
}

ReturnNotificationConfig ReturnNotificationConfig::fromJson(const QJsonObject& obj)
{
    ReturnNotificationConfig cfg;
    cfg.enabled = obj.value("enabled").toBool(cfg.enabled);
    cfg.title = obj.value("title").toString(cfg.title);
    cfg.body = obj.value("body").toString(cfg.body);
    cfg.hoursBeforeNotification = obj.value("hoursBeforeNotification").toInt(cfg.hoursBeforeNotification);
    cfg.repeating = obj.value("repeating").toBool(cfg.repeating);
    if (obj.contains("repeatInterval"))
        cfg.repeatInterval = repeatIntervalFromString(obj.value("repeatInterval").toString());
    cfg.identifier = obj.value("identifier").toString(cfg.identifier);
    return cfg;
}

QString eventTypeToString(NotificationEvent::Type type)
{
    switch (type) {
    case NotificationEvent::Type::Received: return QStringLiteral("received");
    case NotificationEvent::Type::Tapped: return QStringLiteral("tapped");
    case NotificationEvent::Type::PermissionGranted: return QStringLiteral("permission_granted");
    case NotificationEvent::Type::PermissionDenied: return QStringLiteral("permission_denied");
    case NotificationEvent::Type::Error: return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

} // namespace lnc
