#pragma once

#include "INotificationService.hpp"
#include "core/notify/AsyncOperation.hpp"
#include "core/notify/CircuitBreaker.hpp"
#include "core/notify/GroupIndex.hpp"
#include "core/notify/IdentifierRegistry.hpp"
#include "core/notify/MainThreadQueue.hpp"
#include "core/notify/Metrics.hpp"
#include "core/notify/ObjectPool.hpp"
#include "core/notify/PersistenceController.hpp"
#include "core/platform/IPlatformNotifier.hpp"
#include "core/services/EventAggregator.hpp"
#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <QVariantMap>
#include <atomic>
#include <chrono>
#include <future>

namespace lnc {

class NotifyConfig;

/**
 * Schedules, tracks and persists local notifications.
 *
 * Lives on one thread (the owner). Every call that reaches the platform
 * notifier or the store file must be made there; other threads use the
 * *Async variants, which run the call on the owner thread during tick().
 * Lookups (scheduledCount, isScheduled, ...) are safe from any thread.
 *
 * The notifier is not owned and must outlive the service.
 */
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    static constexpr const char* kReturnGroup = "return_group";
    static constexpr qint64 kUrgentReturnDelaySeconds = 60;

    NotificationService(IPlatformNotifier* notifier, const NotifyConfig& config, QObject* parent = nullptr);
    ~NotificationService() override;

    /// Restore persisted state and start ticking. Idempotent.
    bool initialize();
    /// Flush pending state, stop ticking and refuse further work.
    void shutdown();
    bool isInitialized() const { return initialized_; }
    bool isShutdown() const { return shutdown_.load(); }

    // INotificationService
    bool schedule(const NotificationRequest& request) override;
    int scheduleBatch(const QList<NotificationRequest>& requests) override;
    void cancel(const QString& identifier) override;
    int cancelBatch(const QStringList& identifiers) override;
    int cancelGroup(const QString& groupKey) override;
    void cancelAll() override;
    int scheduledCount() const override;
    bool isScheduled(const QString& identifier) const override;
    bool hasPermission() const override { return permissionGranted_.load(); }
    void requestPermission(std::function<void(bool granted)> callback) override;

    bool schedule(const QString& title, const QString& body, qint64 delaySeconds,
                  const QString& identifier = {});
    bool scheduleRepeating(const QString& title, const QString& body, qint64 delaySeconds,
                           RepeatInterval interval, const QString& identifier = {},
                           const QString& groupKey = {});
    bool scheduleAt(const QString& title, const QString& body, const QDateTime& when,
                    const QString& identifier = {});

    void cancelAllDisplayed();
    /// cancelAll() plus cancelAllDisplayed().
    void cancelAllNotifications();

    QStringList scheduledIdentifiers() const;
    int countInGroup(const QString& groupKey) const;
    QStringList membersOfGroup(const QString& groupKey) const;
    NotificationStatus notificationStatus(const QString& identifier) const;

    /// Drop entries the platform no longer knows about. Returns how many were removed.
    int cleanupExpired();

    /// Re-read the platform permission; publishes an event if it changed.
    bool refreshPermission();

    // Async API. get() throws TimeoutError, OperationCancelled, QueueFullError
    // or ServiceUnavailable. Never wait on these from the owner thread.
    std::future<bool> scheduleAsync(const NotificationRequest& request, CancellationToken token = {});
    std::future<void> cancelAsync(const QString& identifier, CancellationToken token = {});
    std::future<int> scheduledCountAsync(CancellationToken token = {});
    std::future<int> scheduleBatchAsync(const QList<NotificationRequest>& requests, CancellationToken token = {});
    std::future<int> cancelBatchAsync(const QStringList& identifiers, CancellationToken token = {});
    std::future<bool> requestPermissionAsync(CancellationToken token = {});

    // Return-to-app reminder
    void configureReturnNotification(const ReturnNotificationConfig& config);
    void setReturnNotificationEnabled(bool enabled);
    ReturnNotificationConfig returnNotificationConfig() const;
    void handleAppBackgrounded();
    void handleAppForegrounded();
    double hoursSinceLastForeground() const;

    EventAggregator& events() { return events_; }
    MetricsSnapshot metrics() { return metrics_.snapshot(); }
    void resetMetrics() { metrics_.reset(); }
    /// Empty path uses metrics.export_path from the config.
    bool exportMetrics(const QString& path = {});
    QVariantMap debugInfo() const;

    PersistenceController::FlushResult flushNow();
    bool isCircuitOpen() const { return breaker_.isOpen(); }

    /// Drain queued work and advance the circuit breaker. Driven by a timer after initialize().
    void tick();

    MainThreadQueue& mainThreadQueue() { return queue_; }

signals:
    void notificationScheduled(const QString& identifier);
    void notificationCancelled(const QString& identifier);
    void permissionChanged(bool granted);
    void errorOccurred(const QString& operation, const QString& message);

private:
    bool usable(const char* operation) const;
    bool acceptable(const NotificationRequest& request) const;
    bool scheduleOne(NotificationRequest& request);
    void track(const NotificationRequest& request, PlatformHandle handle,
               const IdentifierRegistry::InsertResult& inserted);
    int cancelMany(const QStringList& identifiers);
    bool cancelOnPlatform(PlatformHandle handle, const QString& identifier);
    void recordFailure(const QString& operation, const QString& message);
    void onPlatformEvent(const NotificationEvent& event);
    void updatePermission(bool granted, bool publish);
    void scheduleReturnNotification();
    void stampLastActive();
    NotificationStore snapshotStore() const;

    IPlatformNotifier* notifier_;

    const int maxBatchSize_;
    const int pendingLimit_;
    const int maxActionsPerTick_;
    const int tickBudgetMs_;
    const int tickIntervalMs_;
    const int metricsFlushIntervalMs_;
    const std::chrono::milliseconds asyncTimeout_;
    const std::chrono::milliseconds permissionTimeout_;
    const QString metricsExportPath_;
    const QString channelId_;

    Metrics metrics_;
    CircuitBreaker breaker_;
    MainThreadQueue queue_;
    IdentifierRegistry registry_;
    GroupIndex groups_;
    ObjectPool<NotificationRequest> requestPool_;
    EventAggregator events_;

    PersistenceController* persistence_ = nullptr;
    QTimer* tickTimer_ = nullptr;
    QTimer* metricsTimer_ = nullptr;

    mutable QMutex stateMutex_;
    ReturnNotificationConfig returnConfig_;
    qint64 lastActiveUnixTime_ = 0;

    bool initialized_ = false;
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> permissionGranted_{false};
};

} // namespace lnc
