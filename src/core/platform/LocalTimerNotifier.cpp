#include "core/platform/LocalTimerNotifier.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace lnc {

namespace {
constexpr qint64 kMaxTimerChunkMs = 24LL * 60 * 60 * 1000;
}

LocalTimerNotifier::LocalTimerNotifier(QObject* parent) : QObject(parent) {}

LocalTimerNotifier::~LocalTimerNotifier()
{
    for (auto& e : entries_) {
        if (e.timer) e.timer->stop();
    }
}

void LocalTimerNotifier::prepare(NotificationRequest&, const QString&) {}

void LocalTimerNotifier::onDelivered(const NotificationRequest&) {}

PlatformHandle LocalTimerNotifier::schedule(const NotificationRequest& original, const QString& channelId)
{
    NotificationRequest request = original;
    prepare(request, channelId);

    PlatformHandle handle = assignHandle(request);
    if (handle < 0)
        return handle;

    if (entries_.contains(handle))
        drop(handle);

    Entry entry;
    entry.request = request;
    entry.fireAt = QDateTime::currentDateTimeUtc().addSecs(request.fireDelaySeconds);
    entry.timer = new QTimer(this);
    entry.timer->setSingleShot(true);
    connect(entry.timer, &QTimer::timeout, this, [this, handle]() { onTimer(handle); });
    entries_.insert(handle, entry);

    arm(handle);
    BOOST_LOG_TRIVIAL(debug) << "[" << platformName().toStdString() << "] Scheduled "
                             << request.identifier.toStdString() << " as " << handle
                             << " in " << request.fireDelaySeconds << "s";
    return handle;
}

void LocalTimerNotifier::arm(PlatformHandle handle)
{
    auto it = entries_.find(handle);
    if (it == entries_.end()) return;

    qint64 remaining = QDateTime::currentDateTimeUtc().msecsTo(it->fireAt);
    remaining = std::clamp<qint64>(remaining, 0, kMaxTimerChunkMs);
    it->timer->start(static_cast<int>(remaining));
}

void LocalTimerNotifier::onTimer(PlatformHandle handle)
{
    auto it = entries_.find(handle);
    if (it == entries_.end()) return;

    if (QDateTime::currentDateTimeUtc() < it->fireAt) {
        arm(handle);
        return;
    }

    NotificationRequest request = it->request;
    qint64 period = request.repeatPeriodSeconds();
    if (period > 0) {
        it->fireAt = it->fireAt.addSecs(period);
        it->status = NotificationStatus::Scheduled;
        arm(handle);
    } else {
        it->status = NotificationStatus::Delivered;
    }

    onDelivered(request);
    emit delivered(handle, request.identifier);
    emitEvent(NotificationEvent::Type::Received, request.title, request.body);
}

void LocalTimerNotifier::drop(PlatformHandle handle)
{
    auto it = entries_.find(handle);
    if (it == entries_.end()) return;
    if (it->timer) {
        it->timer->stop();
        it->timer->deleteLater();
    }
    entries_.erase(it);
}

void LocalTimerNotifier::cancel(PlatformHandle handle, const QString& identifier)
{
    if (!entries_.contains(handle)) {
        BOOST_LOG_TRIVIAL(debug) << "[" << platformName().toStdString() << "] Cancel of unknown handle "
                                 << handle << " (" << identifier.toStdString() << ")";
        return;
    }
    drop(handle);
}

void LocalTimerNotifier::cancelAllScheduled()
{
    QList<PlatformHandle> pending;
    for (auto it = entries_.cbegin(); it != entries_.cend(); ++it) {
        if (it->status == NotificationStatus::Scheduled)
            pending.append(it.key());
    }
    for (PlatformHandle h : pending)
        drop(h);
}

void LocalTimerNotifier::cancelAllDisplayed()
{
    QList<PlatformHandle> shown;
    for (auto it = entries_.cbegin(); it != entries_.cend(); ++it) {
        if (it->status == NotificationStatus::Delivered)
            shown.append(it.key());
    }
    for (PlatformHandle h : shown)
        drop(h);
}

NotificationStatus LocalTimerNotifier::status(PlatformHandle handle) const
{
    auto it = entries_.constFind(handle);
    if (it == entries_.constEnd())
        return NotificationStatus::Unavailable;
    return it->status;
}

void LocalTimerNotifier::setEventCallback(EventCallback callback)
{
    eventCallback_ = std::move(callback);
}

int LocalTimerNotifier::pendingCount() const
{
    return static_cast<int>(std::count_if(entries_.cbegin(), entries_.cend(), [](const Entry& e) {
        return e.status == NotificationStatus::Scheduled;
    }));
}

int LocalTimerNotifier::displayedCount() const
{
    return static_cast<int>(std::count_if(entries_.cbegin(), entries_.cend(), [](const Entry& e) {
        return e.status == NotificationStatus::Delivered;
    }));
}

bool LocalTimerNotifier::tap(PlatformHandle handle)
{
    auto it = entries_.constFind(handle);
    if (it == entries_.constEnd() || it->status != NotificationStatus::Delivered)
        return false;

    NotificationRequest request = it->request;
    drop(handle);
    emitEvent(NotificationEvent::Type::Tapped, request.title, request.body);
    return true;
}

void LocalTimerNotifier::emitEvent(NotificationEvent::Type type, const QString& title, const QString& body)
{
    if (!eventCallback_) return;

    NotificationEvent event;
    event.type = type;
    event.title = title;
    event.body = body;
    event.timestamp = QDateTime::currentDateTimeUtc();
    eventCallback_(event);
}

} // namespace lnc
