#include "NotificationService.hpp"
#include "core/NotifyConfig.hpp"
#include <QJsonObject>
#include <QPointer>
#include <QSet>
#include <QThread>
#include <QUuid>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <exception>

namespace lnc {

namespace {

int pendingLimitFor(const IPlatformNotifier* notifier, const NotifyConfig& config)
{
    int limit = notifier->maxPending();
    const QString name = notifier->platformName();
    if (name == "iOS")
        limit = std::min(limit, config.iosMaxPending());
    else if (name == "Android")
        limit = std::min(limit, config.androidMaxPending());
    return limit;
}

PersistenceController::Options persistenceOptions(const NotifyConfig& config)
{
    PersistenceController::Options o;
    o.path = config.storePath();
    o.legacyPath = config.legacyStorePath();
    o.debounceMs = config.debounceMs();
    o.retryAttempts = config.saveRetryAttempts();
    o.retryDelayMs = config.saveRetryDelayMs();
    o.maxFileBytes = config.maxStoreBytes();
    return o;
}

} // namespace

NotificationService::NotificationService(IPlatformNotifier* notifier, const NotifyConfig& config,
                                         QObject* parent)
    : QObject(parent)
    , notifier_(notifier)
    , maxBatchSize_(config.maxBatchSize())
    , pendingLimit_(pendingLimitFor(notifier, config))
    , maxActionsPerTick_(config.maxActionsPerTick())
    , tickBudgetMs_(config.tickBudgetMs())
    , tickIntervalMs_(config.tickIntervalMs())
    , metricsFlushIntervalMs_(config.metricsFlushIntervalMs())
    , asyncTimeout_(config.asyncTimeoutMs())
    , permissionTimeout_(config.permissionTimeoutMs())
    , metricsExportPath_(config.metricsExportPath())
    , channelId_(config.androidChannelId())
    , breaker_(config.circuitThreshold(), std::chrono::milliseconds(config.circuitCooldownMs()))
    , queue_(config.queueCapacity(), &metrics_)
    , registry_(config.maxTracked())
    , requestPool_(static_cast<size_t>(std::max(0, config.requestPoolSize())), &metrics_)
    , events_(&queue_, &metrics_, static_cast<size_t>(std::max(0, config.eventPoolSize())))
{
    persistence_ = new PersistenceController(persistenceOptions(config),
                                             [this]() { return snapshotStore(); },
                                             &breaker_, &metrics_, this);

    tickTimer_ = new QTimer(this);
    tickTimer_->setInterval(tickIntervalMs_);
    connect(tickTimer_, &QTimer::timeout, this, &NotificationService::tick);

    metricsTimer_ = new QTimer(this);
    metricsTimer_->setInterval(metricsFlushIntervalMs_);
    connect(metricsTimer_, &QTimer::timeout, this, [this]() { metrics_.flush(); });

    notifier_->setEventCallback([this](const NotificationEvent& e) { onPlatformEvent(e); });
    permissionGranted_ = notifier_->checkPermission();
}

NotificationService::~NotificationService()
{
    shutdown();
}

bool NotificationService::initialize()
{
    if (shutdown_) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] initialize() after shutdown";
        return false;
    }
    if (initialized_)
        return true;

    auto loaded = persistence_->load();
    registry_.restore(loaded.store.notifications);
    {
        QMutexLocker lock(&stateMutex_);
        returnConfig_ = loaded.store.returnConfig;
        lastActiveUnixTime_ = loaded.store.lastForegroundUnixTime;
    }

    permissionGranted_ = notifier_->checkPermission();
    tickTimer_->start();
    metricsTimer_->start();
    initialized_ = true;

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Initialized on " << notifier_->platformName().toStdString()
                            << ", tracking " << registry_.count() << "/" << registry_.capacity()
                            << ", pending limit " << pendingLimit_;
    return true;
}

void NotificationService::shutdown()
{
    if (shutdown_.exchange(true))
        return;

    tickTimer_->stop();
    metricsTimer_->stop();

    if (persistence_->isDirty()) {
        // Final save is attempted even with the circuit open.
        breaker_.reset();
        persistence_->flushNow();
    }

    queue_.clear();
    notifier_->setEventCallback({});
    events_.clear();

    metrics_.flush();
    if (!metricsExportPath_.isEmpty())
        metrics_.exportToFile(metricsExportPath_);

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Shut down with " << registry_.count()
                            << " tracked notifications";
}

bool NotificationService::usable(const char* operation) const
{
    if (shutdown_) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] " << operation << " after shutdown ignored";
        return false;
    }
    if (QThread::currentThread() != thread()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] " << operation
                                   << " called off the owner thread, use the async variant";
        return false;
    }
    return true;
}

bool NotificationService::acceptable(const NotificationRequest& request) const
{
    if (!request.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Rejected '" << request.identifier.toStdString()
                                   << "': title and body are required and the delay must not be negative";
        return false;
    }
    if (request.fireDelaySeconds > kMaxFireDelaySeconds) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Rejected '" << request.identifier.toStdString()
                                   << "': delay " << request.fireDelaySeconds << "s exceeds one year";
        return false;
    }
    return true;
}

// --- Scheduling ---

bool NotificationService::schedule(const NotificationRequest& request)
{
    if (!usable("schedule") || !acceptable(request))
        return false;

    if (breaker_.isOpen()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Circuit open, schedule rejected";
        return false;
    }

    if (registry_.count() >= pendingLimit_
        && (request.identifier.isEmpty() || !registry_.contains(request.identifier))) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Pending limit " << pendingLimit_
                                   << " reached on " << notifier_->platformName().toStdString();
        return false;
    }

    auto buffer = requestPool_.acquire();
    *buffer = request;
    if (buffer->identifier.isEmpty())
        buffer->identifier = QUuid::createUuid().toString(QUuid::WithoutBraces);

    bool ok = scheduleOne(*buffer);
    requestPool_.release(std::move(buffer));
    return ok;
}

bool NotificationService::scheduleOne(NotificationRequest& request)
{
    PlatformHandle handle = kInvalidHandle;
    try {
        handle = notifier_->schedule(request, channelId_);
    } catch (const std::exception& e) {
        recordFailure("schedule", QString::fromUtf8(e.what()));
        return false;
    }

    if (handle < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Platform declined '"
                                   << request.identifier.toStdString() << "'";
        return false;
    }

    track(request, handle, registry_.insert(request.identifier, handle));
    persistence_->markDirty();
    return true;
}

void NotificationService::track(const NotificationRequest& request, PlatformHandle handle,
                                const IdentifierRegistry::InsertResult& inserted)
{
    if (inserted.replacedHandle) {
        groups_.removeMember(request.identifier);
        if (*inserted.replacedHandle != handle)
            cancelOnPlatform(*inserted.replacedHandle, request.identifier);
    }
    if (inserted.evicted)
        groups_.removeMember(inserted.evicted->identifier);
    if (!request.groupKey.isEmpty())
        groups_.addMember(request.groupKey, request.identifier);

    breaker_.recordSuccess();
    metrics_.incrementScheduled();

    BOOST_LOG_TRIVIAL(debug) << "[NotificationService] Scheduled '" << request.identifier.toStdString()
                             << "' in " << request.fireDelaySeconds << "s (handle " << handle << ")";
    emit notificationScheduled(request.identifier);
}

bool NotificationService::schedule(const QString& title, const QString& body, qint64 delaySeconds,
                                   const QString& identifier)
{
    NotificationRequest r;
    r.title = title;
    r.body = body;
    r.fireDelaySeconds = delaySeconds;
    r.identifier = identifier;
    return schedule(r);
}

bool NotificationService::scheduleRepeating(const QString& title, const QString& body, qint64 delaySeconds,
                                            RepeatInterval interval, const QString& identifier,
                                            const QString& groupKey)
{
    NotificationRequest r;
    r.title = title;
    r.body = body;
    r.fireDelaySeconds = delaySeconds;
    r.identifier = identifier;
    r.groupKey = groupKey;
    r.repeats = interval != RepeatInterval::None;
    r.repeatInterval = interval;
    return schedule(r);
}

bool NotificationService::scheduleAt(const QString& title, const QString& body, const QDateTime& when,
                                     const QString& identifier)
{
    qint64 delay = QDateTime::currentDateTimeUtc().secsTo(when);
    if (!when.isValid() || delay < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] scheduleAt: time is in the past or invalid";
        return false;
    }
    return schedule(title, body, delay, identifier);
}

int NotificationService::scheduleBatch(const QList<NotificationRequest>& requests)
{
    if (!usable("scheduleBatch"))
        return 0;

    QList<NotificationRequest> batch = requests;
    if (batch.size() > maxBatchSize_) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Batch of " << batch.size()
                                   << " truncated to " << maxBatchSize_;
        batch = batch.mid(0, maxBatchSize_);
    }

    QList<NotificationRequest> accepted;
    QList<RegistryEntry> entries;
    QHash<QString, int> positions;   // identifier -> index in entries
    int room = pendingLimit_ - registry_.count();

    for (NotificationRequest request : batch) {
        if (breaker_.isOpen()) {
            BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Circuit opened during batch, stopping";
            break;
        }
        if (!acceptable(request))
            continue;
        if (request.identifier.isEmpty())
            request.identifier = QUuid::createUuid().toString(QUuid::WithoutBraces);

        const bool grows = !registry_.contains(request.identifier) && !positions.contains(request.identifier);
        if (grows && room <= 0) {
            BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Pending limit reached, batch cut short";
            break;
        }

        PlatformHandle handle = kInvalidHandle;
        try {
            handle = notifier_->schedule(request, channelId_);
        } catch (const std::exception& e) {
            recordFailure("scheduleBatch", QString::fromUtf8(e.what()));
            continue;
        }
        if (handle < 0)
            continue;

        auto seen = positions.constFind(request.identifier);
        if (seen != positions.constEnd()) {
            // Same identifier twice in one batch: the later request wins.
            if (entries[*seen].handle != handle)
                cancelOnPlatform(entries[*seen].handle, request.identifier);
            entries[*seen].handle = handle;
            accepted[*seen] = request;
            continue;
        }

        positions.insert(request.identifier, static_cast<int>(entries.size()));
        entries.append({request.identifier, handle});
        accepted.append(request);
        if (grows)
            --room;
    }

    if (entries.isEmpty())
        return 0;

    QHash<QString, PlatformHandle> replaced;
    for (const auto& e : entries) {
        if (auto old = registry_.handleOf(e.identifier))
            replaced.insert(e.identifier, *old);
    }

    const QList<RegistryEntry> evicted = registry_.insertMany(entries);
    for (const auto& gone : evicted)
        groups_.removeMember(gone.identifier);

    int tracked = 0;
    for (int i = 0; i < accepted.size(); ++i) {
        const auto& request = accepted.at(i);
        // Evicted by a later entry of this batch
        if (!registry_.contains(request.identifier))
            continue;
        IdentifierRegistry::InsertResult result;
        auto old = replaced.constFind(request.identifier);
        if (old != replaced.constEnd())
            result.replacedHandle = *old;
        track(request, entries.at(i).handle, result);
        ++tracked;
    }

    persistence_->markDirty();
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Batch scheduled " << tracked
                            << "/" << batch.size();
    return tracked;
}

// --- Cancellation ---

bool NotificationService::cancelOnPlatform(PlatformHandle handle, const QString& identifier)
{
    try {
        notifier_->cancel(handle, identifier);
        return true;
    } catch (const std::exception& e) {
        recordFailure("cancel", QString::fromUtf8(e.what()));
        return false;
    }
}

void NotificationService::cancel(const QString& identifier)
{
    if (!usable("cancel"))
        return;

    auto handle = registry_.remove(identifier);
    if (!handle) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] cancel: '" << identifier.toStdString()
                                 << "' is not tracked";
        return;
    }

    groups_.removeMember(identifier);
    cancelOnPlatform(*handle, identifier);
    persistence_->markDirty();
    metrics_.incrementCancelled();
    emit notificationCancelled(identifier);
}

int NotificationService::cancelMany(const QStringList& identifiers)
{
    const QList<RegistryEntry> removed = registry_.removeMany(identifiers);
    if (removed.isEmpty())
        return 0;

    for (const auto& e : removed) {
        groups_.removeMember(e.identifier);
        cancelOnPlatform(e.handle, e.identifier);
        emit notificationCancelled(e.identifier);
    }

    persistence_->markDirty();
    metrics_.incrementCancelled(static_cast<uint64_t>(removed.size()));
    return static_cast<int>(removed.size());
}

int NotificationService::cancelBatch(const QStringList& identifiers)
{
    if (!usable("cancelBatch"))
        return 0;

    QStringList batch = identifiers;
    if (batch.size() > maxBatchSize_) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Cancel batch of " << batch.size()
                                   << " truncated to " << maxBatchSize_;
        batch = batch.mid(0, maxBatchSize_);
    }
    return cancelMany(batch);
}

int NotificationService::cancelGroup(const QString& groupKey)
{
    if (!usable("cancelGroup"))
        return 0;

    const QSet<QString> members = groups_.membersOf(groupKey);
    int n = cancelMany(QStringList(members.cbegin(), members.cend()));
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Cancelled " << n << " in group '"
                            << groupKey.toStdString() << "'";
    return n;
}

void NotificationService::cancelAll()
{
    if (!usable("cancelAll"))
        return;

    try {
        notifier_->cancelAllScheduled();
    } catch (const std::exception& e) {
        recordFailure("cancelAll", QString::fromUtf8(e.what()));
    }

    const QStringList ids = registry_.identifiers();
    registry_.clear();
    groups_.clear();
    for (const auto& id : ids)
        emit notificationCancelled(id);

    metrics_.incrementCancelled(static_cast<uint64_t>(ids.size()));
    persistence_->markDirty();
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Cancelled all (" << ids.size() << ")";
}

void NotificationService::cancelAllDisplayed()
{
    if (!usable("cancelAllDisplayed"))
        return;

    try {
        notifier_->cancelAllDisplayed();
    } catch (const std::exception& e) {
        recordFailure("cancelAllDisplayed", QString::fromUtf8(e.what()));
    }
}

void NotificationService::cancelAllNotifications()
{
    cancelAll();
    cancelAllDisplayed();
}

// --- Queries ---

int NotificationService::scheduledCount() const
{
    return registry_.count();
}

bool NotificationService::isScheduled(const QString& identifier) const
{
    return registry_.contains(identifier);
}

QStringList NotificationService::scheduledIdentifiers() const
{
    return registry_.identifiers();
}

int NotificationService::countInGroup(const QString& groupKey) const
{
    return groups_.countOf(groupKey);
}

QStringList NotificationService::membersOfGroup(const QString& groupKey) const
{
    const QSet<QString> members = groups_.membersOf(groupKey);
    QStringList out(members.cbegin(), members.cend());
    out.sort();
    return out;
}

NotificationStatus NotificationService::notificationStatus(const QString& identifier) const
{
    auto handle = registry_.handleOf(identifier);
    if (!handle)
        return NotificationStatus::Unavailable;
    if (!usable("notificationStatus"))
        return NotificationStatus::Unknown;

    try {
        return notifier_->status(*handle);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationService] Status query failed: " << e.what();
        return NotificationStatus::Unknown;
    }
}

int NotificationService::cleanupExpired()
{
    if (!usable("cleanupExpired"))
        return 0;

    QStringList expired;
    for (const auto& e : registry_.snapshot()) {
        NotificationStatus s = NotificationStatus::Unknown;
        try {
            s = notifier_->status(e.handle);
        } catch (const std::exception& ex) {
            BOOST_LOG_TRIVIAL(error) << "[NotificationService] Status check failed for '"
                                     << e.identifier.toStdString() << "': " << ex.what();
            continue;
        }
        if (s == NotificationStatus::Unavailable || s == NotificationStatus::Unknown)
            expired.append(e.identifier);
    }

    if (expired.isEmpty())
        return 0;

    const QList<RegistryEntry> removed = registry_.removeMany(expired);
    for (const auto& e : removed)
        groups_.removeMember(e.identifier);
    persistence_->markDirty();

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Cleaned up " << removed.size()
                            << " expired notifications";
    return static_cast<int>(removed.size());
}

// --- Permission ---

void NotificationService::updatePermission(bool granted, bool publish)
{
    if (permissionGranted_.exchange(granted) == granted)
        return;

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Permission " << (granted ? "granted" : "revoked");
    if (publish)
        events_.publish(granted ? NotificationEvent::Type::PermissionGranted
                                : NotificationEvent::Type::PermissionDenied);
    emit permissionChanged(granted);
}

void NotificationService::requestPermission(std::function<void(bool granted)> callback)
{
    if (!usable("requestPermission")) {
        if (callback) callback(false);
        return;
    }

    QPointer<NotificationService> self(this);
    try {
        notifier_->requestPermission([self, callback](bool granted) {
            if (self)
                self->updatePermission(granted, false);
            if (callback)
                callback(granted);
        });
    } catch (const std::exception& e) {
        recordFailure("requestPermission", QString::fromUtf8(e.what()));
        if (callback) callback(false);
    }
}

bool NotificationService::refreshPermission()
{
    if (!usable("refreshPermission"))
        return permissionGranted_;

    bool granted = permissionGranted_;
    try {
        granted = notifier_->checkPermission();
    } catch (const std::exception& e) {
        recordFailure("refreshPermission", QString::fromUtf8(e.what()));
        return permissionGranted_;
    }
    updatePermission(granted, true);
    return granted;
}

void NotificationService::onPlatformEvent(const NotificationEvent& event)
{
    if (event.type == NotificationEvent::Type::PermissionGranted)
        updatePermission(true, false);
    else if (event.type == NotificationEvent::Type::PermissionDenied)
        updatePermission(false, false);

    events_.publish(event.type, event.title, event.body, event.error);
}

// --- Async ---

std::future<bool> NotificationService::scheduleAsync(const NotificationRequest& request, CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<bool>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return runOnMainThread<bool>(queue_, [this, request]() { return schedule(request); },
                                 asyncTimeout_, token, "scheduleAsync");
}

std::future<void> NotificationService::cancelAsync(const QString& identifier, CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<void>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return runOnMainThread<void>(queue_, [this, identifier]() { cancel(identifier); },
                                 asyncTimeout_, token, "cancelAsync");
}

std::future<int> NotificationService::scheduledCountAsync(CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<int>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return runOnMainThread<int>(queue_, [this]() { return scheduledCount(); },
                                asyncTimeout_, token, "scheduledCountAsync");
}

std::future<int> NotificationService::scheduleBatchAsync(const QList<NotificationRequest>& requests,
                                                         CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<int>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return runOnMainThread<int>(queue_, [this, requests]() { return scheduleBatch(requests); },
                                asyncTimeout_, token, "scheduleBatchAsync");
}

std::future<int> NotificationService::cancelBatchAsync(const QStringList& identifiers, CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<int>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return runOnMainThread<int>(queue_, [this, identifiers]() { return cancelBatch(identifiers); },
                                asyncTimeout_, token, "cancelBatchAsync");
}

std::future<bool> NotificationService::requestPermissionAsync(CancellationToken token)
{
    if (shutdown_)
        return makeFailedFuture<bool>(std::make_exception_ptr(ServiceUnavailable("notification service is shut down")));
    return startOnMainThread<bool>(queue_, [this](Completion<bool> done) {
        requestPermission([done](bool granted) { done(granted); });
    }, permissionTimeout_, token, "requestPermissionAsync");
}

// --- Return notification ---

void NotificationService::configureReturnNotification(const ReturnNotificationConfig& config)
{
    {
        QMutexLocker lock(&stateMutex_);
        returnConfig_ = config;
    }
    persistence_->markDirty();
}

void NotificationService::setReturnNotificationEnabled(bool enabled)
{
    QString identifier;
    {
        QMutexLocker lock(&stateMutex_);
        returnConfig_.enabled = enabled;
        identifier = returnConfig_.identifier;
    }
    persistence_->markDirty();
    if (!enabled)
        cancel(identifier);
}

ReturnNotificationConfig NotificationService::returnNotificationConfig() const
{
    QMutexLocker lock(&stateMutex_);
    return returnConfig_;
}

void NotificationService::stampLastActive()
{
    {
        QMutexLocker lock(&stateMutex_);
        lastActiveUnixTime_ = QDateTime::currentSecsSinceEpoch();
    }
    persistence_->markDirty();
}

double NotificationService::hoursSinceLastForeground() const
{
    qint64 last;
    {
        QMutexLocker lock(&stateMutex_);
        last = lastActiveUnixTime_;
    }
    if (last <= 0)
        return 0.0;
    return static_cast<double>(QDateTime::currentSecsSinceEpoch() - last) / 3600.0;
}

void NotificationService::scheduleReturnNotification()
{
    const ReturnNotificationConfig cfg = returnNotificationConfig();
    if (!cfg.enabled)
        return;

    cancel(cfg.identifier);

    NotificationRequest r;
    r.title = cfg.title;
    r.body = cfg.body;
    r.fireDelaySeconds = static_cast<qint64>(cfg.hoursBeforeNotification) * 3600;
    r.identifier = cfg.identifier;
    r.repeats = cfg.repeating;
    r.repeatInterval = cfg.repeatInterval;
    r.groupKey = kReturnGroup;
    schedule(r);
}

void NotificationService::handleAppBackgrounded()
{
    if (!usable("handleAppBackgrounded"))
        return;

    stampLastActive();
    scheduleReturnNotification();
    persistence_->flushNow();
}

void NotificationService::handleAppForegrounded()
{
    if (!usable("handleAppForegrounded"))
        return;

    const ReturnNotificationConfig cfg = returnNotificationConfig();
    const QString urgentId = cfg.identifier + "_urgent";

    cancel(cfg.identifier);
    cancel(urgentId);

    if (cfg.enabled && hoursSinceLastForeground() >= cfg.hoursBeforeNotification) {
        NotificationRequest urgent;
        urgent.title = QStringLiteral("Long time no see!");
        urgent.body = QStringLiteral("Special rewards waiting for you!");
        urgent.fireDelaySeconds = kUrgentReturnDelaySeconds;
        urgent.identifier = urgentId;
        urgent.groupKey = kReturnGroup;
        schedule(urgent);
    }

    stampLastActive();
    cancelAllDisplayed();
    refreshPermission();
}

// --- Diagnostics / plumbing ---

bool NotificationService::exportMetrics(const QString& path)
{
    const QString target = path.isEmpty() ? metricsExportPath_ : path;
    if (target.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] No metrics export path configured";
        return false;
    }
    return metrics_.exportToFile(target);
}

QVariantMap NotificationService::debugInfo() const
{
    QVariantMap info;
    info["platform"] = notifier_->platformName();
    info["initialized"] = initialized_;
    info["shutdown"] = shutdown_.load();
    info["scheduledCount"] = registry_.count();
    info["capacity"] = registry_.capacity();
    info["pendingLimit"] = pendingLimit_;
    info["groupCount"] = groups_.groupCount();
    info["circuitOpen"] = breaker_.isOpen();
    info["consecutiveFailures"] = breaker_.consecutiveFailures();
    info["queueSize"] = queue_.size();
    info["queueDrops"] = static_cast<qulonglong>(queue_.dropCount());
    info["dirty"] = persistence_->isDirty();
    info["hasPermission"] = permissionGranted_.load();
    info["pooledRequests"] = static_cast<qulonglong>(requestPool_.available());
    info["pooledEvents"] = static_cast<qulonglong>(events_.pooledEvents());
    info["storePath"] = persistence_->options().path;
    info["hoursSinceLastForeground"] = hoursSinceLastForeground();
    info["returnNotification"] = returnNotificationConfig().toJson().toVariantMap();
    return info;
}

PersistenceController::FlushResult NotificationService::flushNow()
{
    return persistence_->flushNow();
}

void NotificationService::tick()
{
    if (breaker_.tick() && persistence_->isDirty()) {
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Circuit closed, retrying pending save";
        persistence_->markDirty();
    }
    queue_.drain(maxActionsPerTick_, tickBudgetMs_);
}

void NotificationService::recordFailure(const QString& operation, const QString& message)
{
    metrics_.incrementErrors();
    breaker_.recordFailure();
    BOOST_LOG_TRIVIAL(error) << "[NotificationService] " << operation.toStdString() << " failed: "
                             << message.toStdString();
    events_.publishError(operation, message);
    emit errorOccurred(operation, message);
}

NotificationStore NotificationService::snapshotStore() const
{
    NotificationStore store;
    store.notifications = registry_.snapshot();
    QMutexLocker lock(&stateMutex_);
    store.returnConfig = returnConfig_;
    store.lastForegroundUnixTime = lastActiveUnixTime_;
    return store;
}

} // namespace lnc
