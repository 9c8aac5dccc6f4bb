#pragma once

#include "core/platform/IPlatformNotifier.hpp"
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QTimer>

namespace lnc {

/**
 * Notifier that delivers in-process with QTimers.
 *
 * Platform subclasses decide the handle scheme, the pending limit, the
 * permission flow and which requests they accept. Delivery re-arms in
 * chunks of at most one day so delays beyond QTimer's int range work.
 * A delivered one-shot notification stays Delivered until it is cancelled
 * or cleared with cancelAllDisplayed(); repeating ones are re-armed.
 */
class LocalTimerNotifier : public QObject, public IPlatformNotifier {
    Q_OBJECT
public:
    explicit LocalTimerNotifier(QObject* parent = nullptr);
    ~LocalTimerNotifier() override;

    PlatformHandle schedule(const NotificationRequest& request, const QString& channelId) override;
    void cancel(PlatformHandle handle, const QString& identifier) override;
    void cancelAllScheduled() override;
    void cancelAllDisplayed() override;
    NotificationStatus status(PlatformHandle handle) const override;
    void setEventCallback(EventCallback callback) override;

    int pendingCount() const;
    int displayedCount() const;

    /// User interaction with a delivered notification. Returns false if not displayed.
    bool tap(PlatformHandle handle);

signals:
    void delivered(qint64 handle, const QString& identifier);

protected:
    virtual PlatformHandle assignHandle(const NotificationRequest& request) = 0;
    /// Adjust the request to what the platform supports, or throw PlatformError to refuse it.
    virtual void prepare(NotificationRequest& request, const QString& channelId);
    virtual void onDelivered(const NotificationRequest& request);

    void emitEvent(NotificationEvent::Type type, const QString& title, const QString& body);

private:
    struct Entry {
        NotificationRequest request;
        QDateTime fireAt;
        QTimer* timer = nullptr;
        NotificationStatus status = NotificationStatus::Scheduled;
    };

    void arm(PlatformHandle handle);
    void onTimer(PlatformHandle handle);
    void drop(PlatformHandle handle);

    QHash<PlatformHandle, Entry> entries_;
    EventCallback eventCallback_;
};

} // namespace lnc
