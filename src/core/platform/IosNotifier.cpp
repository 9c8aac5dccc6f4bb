#include "core/platform/IosNotifier.hpp"
#include <QCryptographicHash>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include <utility>

namespace lnc {

IosNotifier::IosNotifier(bool autoIncrementBadge, QObject* parent)
    : LocalTimerNotifier(parent)
    , autoIncrementBadge_(autoIncrementBadge)
    , prompt_([] { return true; })
{
}

PlatformHandle IosNotifier::handleForIdentifier(const QString& identifier)
{
    // First 7 bytes of SHA-1: stable across runs and always positive.
    QByteArray digest = QCryptographicHash::hash(identifier.toUtf8(), QCryptographicHash::Sha1);
    PlatformHandle h = 0;
    for (int i = 0; i < 7; ++i)
        h = (h << 8) | static_cast<unsigned char>(digest.at(i));
    return h;
}

void IosNotifier::requestPermission(PermissionCallback callback)
{
    if (authorized_) {
        if (callback) callback(true);
        return;
    }
    if (requestInFlight_) {
        BOOST_LOG_TRIVIAL(debug) << "[iOS] Authorization request already pending";
        permissionWaiters_.append(std::move(callback));
        return;
    }

    requestInFlight_ = true;
    permissionWaiters_.append(std::move(callback));
    QTimer::singleShot(0, this, [this]() {
        requestInFlight_ = false;
        authorized_ = prompt_ ? prompt_() : false;
        BOOST_LOG_TRIVIAL(info) << "[iOS] Authorization (alert|badge|sound) "
                                << (authorized_ ? "granted" : "denied");
        emitEvent(authorized_ ? NotificationEvent::Type::PermissionGranted
                              : NotificationEvent::Type::PermissionDenied,
                  QString(), QString());
        const QList<PermissionCallback> waiters = std::exchange(permissionWaiters_, {});
        for (const auto& waiter : waiters) {
            if (waiter) waiter(authorized_);
        }
    });
}

void IosNotifier::prepare(NotificationRequest& request, const QString&)
{
    if (!request.repeats)
        return;

    if (request.repeatInterval != RepeatInterval::Daily && request.repeatInterval != RepeatInterval::Weekly)
        throw PlatformError("iOS only repeats daily or weekly: " + request.identifier.toStdString());
}

PlatformHandle IosNotifier::assignHandle(const NotificationRequest& request)
{
    if (request.identifier.isEmpty())
        throw PlatformError("iOS notifications require an identifier");

    return handleForIdentifier(request.identifier);
}

void IosNotifier::onDelivered(const NotificationRequest& request)
{
    if (request.badgeCount >= 0)
        badge_ = request.badgeCount;
    else if (autoIncrementBadge_)
        ++badge_;
    BOOST_LOG_TRIVIAL(trace) << "[iOS] Badge now " << badge_;
}

void IosNotifier::cancelAllDisplayed()
{
    LocalTimerNotifier::cancelAllDisplayed();
    badge_ = 0;
}

} // namespace lnc
