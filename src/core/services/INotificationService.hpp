#pragma once

#include "core/notify/NotificationTypes.hpp"
#include <QList>
#include <QString>
#include <QStringList>
#include <functional>

namespace lnc {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Schedule a local notification. An empty identifier gets a generated UUID.
    /// Returns false if the request was rejected or the platform failed (details are logged).
    virtual bool schedule(const NotificationRequest& request) = 0;

    /// Schedule up to the batch limit in one pass. Returns how many were scheduled.
    virtual int scheduleBatch(const QList<NotificationRequest>& requests) = 0;

    /// Cancel by identifier. Unknown identifiers are ignored.
    virtual void cancel(const QString& identifier) = 0;

    /// Cancel up to the batch limit. Returns how many were tracked and cancelled.
    virtual int cancelBatch(const QStringList& identifiers) = 0;

    virtual int cancelGroup(const QString& groupKey) = 0;
    virtual void cancelAll() = 0;

    virtual int scheduledCount() const = 0;
    virtual bool isScheduled(const QString& identifier) const = 0;

    virtual bool hasPermission() const = 0;
    virtual void requestPermission(std::function<void(bool granted)> callback) = 0;
};

} // namespace lnc
