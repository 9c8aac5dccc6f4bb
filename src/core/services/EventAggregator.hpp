#pragma once

#include "core/notify/NotificationTypes.hpp"
#include "core/notify/ObjectPool.hpp"
#include <QMap>
#include <QMutex>
#include <QString>
#include <functional>

namespace lnc {

class MainThreadQueue;
class Metrics;

/**
 * Fan-out of notification events to named subscribers.
 *
 * publish() delivers synchronously on the calling thread, handing each
 * subscriber its own pooled event. A subscriber that throws is logged by
 * name and skipped; the others still run. Error reports are posted to the
 * main-thread queue so they never run inside the caller's locks.
 */
class EventAggregator {
public:
    using Handler = std::function<void(const NotificationEvent&)>;
    using ErrorHandler = std::function<void(const QString& operation, const QString& message)>;

    EventAggregator(MainThreadQueue* queue, Metrics* metrics, size_t poolSize = 10);

    int subscribe(const QString& name, Handler handler);
    void unsubscribe(int subscriptionId);

    int subscribeErrors(const QString& name, ErrorHandler handler);
    void unsubscribeErrors(int subscriptionId);

    void publish(NotificationEvent::Type type, const QString& title = {}, const QString& body = {},
                 const QString& error = {});
    void publishError(const QString& operation, const QString& message);

    int subscriberCount() const;
    int errorSubscriberCount() const;
    void clear();

    size_t pooledEvents() const { return pool_.available(); }

private:
    template <typename H>
    struct Subscription {
        QString name;
        H handler;
    };

    void deliverError(const QString& operation, const QString& message);

    MainThreadQueue* queue_;
    ObjectPool<NotificationEvent> pool_;

    mutable QMutex mutex_;
    int nextId_ = 1;
    QMap<int, Subscription<Handler>> handlers_;
    QMap<int, Subscription<ErrorHandler>> errorHandlers_;
};

} // namespace lnc
