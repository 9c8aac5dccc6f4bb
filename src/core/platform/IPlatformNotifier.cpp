#include "core/platform/IPlatformNotifier.hpp"

namespace lnc {

QString notificationStatusToString(NotificationStatus status)
{
    switch (status) {
    case NotificationStatus::Scheduled: return QStringLiteral("Scheduled");
    case NotificationStatus::Delivered: return QStringLiteral("Delivered");
    case NotificationStatus::Unavailable: return QStringLiteral("Unavailable");
    case NotificationStatus::Unknown: break;
    }
    return QStringLiteral("Unknown");
}

} // namespace lnc
