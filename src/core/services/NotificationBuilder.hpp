#pragma once

#include "core/notify/NotificationTypes.hpp"
#include <QDateTime>

namespace lnc {

class INotificationService;

/// Fluent construction of a NotificationRequest.
///
///     NotificationBuilder().title("Energy full").body("Come back and play")
///         .delay(3600).group("energy").schedule(service);
class NotificationBuilder {
public:
    NotificationBuilder& title(const QString& v) { request_.title = v; return *this; }
    NotificationBuilder& body(const QString& v) { request_.body = v; return *this; }
    NotificationBuilder& subtitle(const QString& v) { request_.subtitle = v; return *this; }
    NotificationBuilder& identifier(const QString& v) { request_.identifier = v; return *this; }
    NotificationBuilder& group(const QString& v) { request_.groupKey = v; return *this; }
    NotificationBuilder& sound(const QString& v) { request_.soundName = v; return *this; }
    NotificationBuilder& badge(int count) { request_.badgeCount = count; return *this; }
    NotificationBuilder& icons(const QString& smallIcon, const QString& largeIcon);

    NotificationBuilder& delay(qint64 seconds) { request_.fireDelaySeconds = seconds; return *this; }
    /// Fire at an absolute time. Times in the past become an invalid (negative) delay.
    NotificationBuilder& at(const QDateTime& when);

    NotificationBuilder& repeat(RepeatInterval interval);
    NotificationBuilder& repeatEvery(qint64 seconds);

    const NotificationRequest& request() const { return request_; }
    NotificationRequest build() const { return request_; }
    bool schedule(INotificationService& service) const;

private:
    NotificationRequest request_;
};

} // namespace lnc
