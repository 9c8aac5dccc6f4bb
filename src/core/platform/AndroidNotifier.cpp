#include "core/platform/AndroidNotifier.hpp"
#include <QDateTime>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include <utility>

namespace lnc {

AndroidNotifier::AndroidNotifier(AndroidChannelConfig channel, int sdkLevel, QObject* parent)
    : LocalTimerNotifier(parent)
    , channel_(std::move(channel))
    , sdkLevel_(sdkLevel)
    , prompt_([] { return true; })
    , nextId_(QDateTime::currentMSecsSinceEpoch())
{
    granted_ = !permissionRequired();
    BOOST_LOG_TRIVIAL(info) << "[Android] Registered channel " << channel_.id.toStdString()
                            << " (" << channel_.name.toStdString() << "), SDK " << sdkLevel_;
}

bool AndroidNotifier::checkPermission()
{
    return granted_;
}

void AndroidNotifier::requestPermission(PermissionCallback callback)
{
    if (!permissionRequired()) {
        BOOST_LOG_TRIVIAL(debug) << "[Android] SDK " << sdkLevel_ << " < " << kPermissionSdkLevel
                                 << ", notifications always allowed";
        granted_ = true;
        if (callback) callback(true);
        return;
    }

    if (granted_) {
        if (callback) callback(true);
        return;
    }

    if (requestInFlight_) {
        BOOST_LOG_TRIVIAL(debug) << "[Android] Permission request already pending";
        permissionWaiters_.append(std::move(callback));
        return;
    }

    requestInFlight_ = true;
    permissionWaiters_.append(std::move(callback));
    QTimer::singleShot(0, this, [this]() {
        requestInFlight_ = false;
        granted_ = prompt_ ? prompt_() : false;
        BOOST_LOG_TRIVIAL(info) << "[Android] POST_NOTIFICATIONS "
                                << (granted_ ? "granted" : "denied");
        emitEvent(granted_ ? NotificationEvent::Type::PermissionGranted
                           : NotificationEvent::Type::PermissionDenied,
                  QString(), QString());
        const QList<PermissionCallback> waiters = std::exchange(permissionWaiters_, {});
        for (const auto& waiter : waiters) {
            if (waiter) waiter(granted_);
        }
    });
}

void AndroidNotifier::prepare(NotificationRequest& request, const QString& channelId)
{
    if (!channelId.isEmpty() && channelId != channel_.id)
        throw PlatformError("unknown notification channel: " + channelId.toStdString());

    if (request.repeats && request.repeatInterval == RepeatInterval::Custom) {
        BOOST_LOG_TRIVIAL(warning) << "[Android] Custom repeat period not supported, "
                                   << request.identifier.toStdString() << " will fire once";
        request.repeats = false;
    }
}

PlatformHandle AndroidNotifier::assignHandle(const NotificationRequest& request)
{
    if (!granted_) {
        BOOST_LOG_TRIVIAL(warning) << "[Android] No notification permission, declined "
                                   << request.identifier.toStdString();
        return kInvalidHandle;
    }
    return nextId_++;
}

} // namespace lnc
