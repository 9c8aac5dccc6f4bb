#include "core/services/EventAggregator.hpp"
#include "core/notify/MainThreadQueue.hpp"
#include <QList>
#include <boost/log/trivial.hpp>
#include <exception>

namespace lnc {

EventAggregator::EventAggregator(MainThreadQueue* queue, Metrics* metrics, size_t poolSize)
    : queue_(queue)
    , pool_(poolSize, metrics)
{
}

int EventAggregator::subscribe(const QString& name, Handler handler)
{
    if (!handler) return 0;
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    handlers_.insert(id, {name, std::move(handler)});
    return id;
}

void EventAggregator::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    handlers_.remove(subscriptionId);
}

int EventAggregator::subscribeErrors(const QString& name, ErrorHandler handler)
{
    if (!handler) return 0;
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    errorHandlers_.insert(id, {name, std::move(handler)});
    return id;
}

void EventAggregator::unsubscribeErrors(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    errorHandlers_.remove(subscriptionId);
}

void EventAggregator::publish(NotificationEvent::Type type, const QString& title, const QString& body,
                              const QString& error)
{
    QList<Subscription<Handler>> targets;
    {
        QMutexLocker lock(&mutex_);
        targets = handlers_.values();  // copy so handlers may (un)subscribe
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (const auto& sub : targets) {
        auto event = pool_.acquire();
        event->type = type;
        event->title = title;
        event->body = body;
        event->error = error;
        event->timestamp = now;

        try {
            sub.handler(*event);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[EventAggregator] Subscriber '" << sub.name.toStdString()
                                     << "' threw on " << eventTypeToString(type).toStdString()
                                     << ": " << e.what();
        } catch (...) {
            BOOST_LOG_TRIVIAL(error) << "[EventAggregator] Subscriber '" << sub.name.toStdString()
                                     << "' threw a non-standard exception on "
                                     << eventTypeToString(type).toStdString();
        }
        pool_.release(std::move(event));
    }
}

void EventAggregator::publishError(const QString& operation, const QString& message)
{
    if (!queue_) {
        deliverError(operation, message);
        return;
    }
    if (!queue_->enqueue([this, operation, message]() { deliverError(operation, message); }))
        BOOST_LOG_TRIVIAL(warning) << "[EventAggregator] Could not queue error report for "
                                   << operation.toStdString();
}

void EventAggregator::deliverError(const QString& operation, const QString& message)
{
    QList<Subscription<ErrorHandler>> targets;
    {
        QMutexLocker lock(&mutex_);
        targets = errorHandlers_.values();
    }

    for (const auto& sub : targets) {
        try {
            sub.handler(operation, message);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[EventAggregator] Error subscriber '" << sub.name.toStdString()
                                     << "' threw: " << e.what();
        } catch (...) {
            BOOST_LOG_TRIVIAL(error) << "[EventAggregator] Error subscriber '" << sub.name.toStdString()
                                     << "' threw a non-standard exception";
        }
    }

    publish(NotificationEvent::Type::Error, operation, QString(), message);
}

int EventAggregator::subscriberCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(handlers_.size());
}

int EventAggregator::errorSubscriberCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(errorHandlers_.size());
}

void EventAggregator::clear()
{
    QMutexLocker lock(&mutex_);
    handlers_.clear();
    errorHandlers_.clear();
}

} // namespace lnc
