#include "NotificationBuilder.hpp"
#include "INotificationService.hpp"

namespace lnc {

NotificationBuilder& NotificationBuilder::icons(const QString& smallIcon, const QString& largeIcon)
{
    request_.smallIcon = smallIcon;
    request_.largeIcon = largeIcon;
    return *this;
}

NotificationBuilder& NotificationBuilder::at(const QDateTime& when)
{
    request_.fireDelaySeconds = when.isValid() ? QDateTime::currentDateTimeUtc().secsTo(when) : -1;
    return *this;
}

NotificationBuilder& NotificationBuilder::repeat(RepeatInterval interval)
{
    request_.repeats = interval != RepeatInterval::None;
    request_.repeatInterval = interval;
    return *this;
}

NotificationBuilder& NotificationBuilder::repeatEvery(qint64 seconds)
{
    request_.repeats = seconds > 0;
    request_.repeatInterval = seconds > 0 ? RepeatInterval::Custom : RepeatInterval::None;
    request_.repeatIntervalSeconds = seconds;
    return *this;
}

bool NotificationBuilder::schedule(INotificationService& service) const
{
    return service.schedule(request_);
}

} // namespace lnc
