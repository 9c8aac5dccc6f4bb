#include "core/notify/PersistenceController.hpp"
#include "core/notify/CircuitBreaker.hpp"
#include "core/notify/Metrics.hpp"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMetaObject>
#include <QSaveFile>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace lnc {

PersistenceController::PersistenceController(Options options, SnapshotProvider snapshot,
                                             CircuitBreaker* breaker, Metrics* metrics,
                                             QObject* parent)
    : QObject(parent)
    , options_(std::move(options))
    , snapshot_(std::move(snapshot))
    , breaker_(breaker)
    , metrics_(metrics)
{
    debounce_.setSingleShot(true);
    debounce_.setInterval(options_.debounceMs);
    connect(&debounce_, &QTimer::timeout, this, [this]() { flush(); });
}

void PersistenceController::markDirty()
{
    dirty_.store(true);

    if (QThread::currentThread() == thread()) {
        debounce_.start();
    } else {
        QMetaObject::invokeMethod(this, [this]() { debounce_.start(); }, Qt::QueuedConnection);
    }
}

PersistenceController::FlushResult PersistenceController::flush()
{
    if (!dirty_.load())
        return FlushResult::NotDirty;

    if (breaker_ && breaker_->isOpen()) {
        BOOST_LOG_TRIVIAL(warning) << "[Persistence] Circuit open, save postponed";
        return FlushResult::CircuitOpen;
    }

    // Cleared before the snapshot so changes made during the write re-dirty it.
    dirty_.store(false);

    QElapsedTimer timer;
    timer.start();

    NotificationStore store = snapshot_ ? snapshot_() : NotificationStore{};
    QByteArray data = store.encode();

    QString error;
    const int attempts = options_.retryAttempts > 0 ? options_.retryAttempts : 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (writeFile(data, error)) {
            if (metrics_)
                metrics_->recordSaveTime(static_cast<double>(timer.nsecsElapsed()) / 1e6);
            if (breaker_)
                breaker_->recordSuccess();

            if (legacyPendingRemoval_) {
                legacyPendingRemoval_ = false;
                if (QFile::remove(options_.legacyPath))
                    BOOST_LOG_TRIVIAL(info) << "[Persistence] Removed migrated legacy store "
                                            << options_.legacyPath.toStdString();
            }

            BOOST_LOG_TRIVIAL(debug) << "[Persistence] Saved " << store.notifications.size()
                                     << " entries (" << data.size() << " bytes)";
            emit flushed(true);
            return FlushResult::Written;
        }

        BOOST_LOG_TRIVIAL(warning) << "[Persistence] Save attempt " << attempt << "/" << attempts
                                   << " failed: " << error.toStdString();
        if (attempt < attempts && options_.retryDelayMs > 0)
            QThread::msleep(static_cast<unsigned long>(options_.retryDelayMs));
    }

    dirty_.store(true);
    if (breaker_)
        breaker_->recordFailure();
    if (metrics_)
        metrics_->incrementErrors();
    BOOST_LOG_TRIVIAL(error) << "[Persistence] Save failed after " << attempts
                             << " attempts, keeping state dirty";
    emit flushed(false);
    return FlushResult::Failed;
}

PersistenceController::FlushResult PersistenceController::flushNow()
{
    debounce_.stop();
    return flush();
}

bool PersistenceController::writeFile(const QByteArray& data, QString& error) const
{
    QFileInfo info(options_.path);
    if (!QDir().mkpath(info.absolutePath())) {
        error = QStringLiteral("cannot create directory ") + info.absolutePath();
        return false;
    }

    QSaveFile file(options_.path);
    if (!file.open(QIODevice::WriteOnly)) {
        error = file.errorString();
        return false;
    }
    if (file.write(data) != data.size()) {
        error = file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        error = file.errorString();
        return false;
    }
    return true;
}

void PersistenceController::discardFile(const QString& path, const char* reason) const
{
    BOOST_LOG_TRIVIAL(error) << "[Persistence] Discarding " << path.toStdString()
                             << " (" << reason << "), starting with an empty store";
    if (!QFile::remove(path))
        BOOST_LOG_TRIVIAL(warning) << "[Persistence] Could not delete " << path.toStdString();
}

PersistenceController::LoadResult PersistenceController::load()
{
    LoadResult result;

    QFileInfo primary(options_.path);
    if (!primary.exists()) {
        if (options_.legacyPath.isEmpty() || !QFileInfo::exists(options_.legacyPath)) {
            BOOST_LOG_TRIVIAL(info) << "[Persistence] No saved store at "
                                    << options_.path.toStdString() << ", first run";
            return result;
        }

        QFile legacy(options_.legacyPath);
        if (QFileInfo(legacy).size() > options_.maxFileBytes || !legacy.open(QIODevice::ReadOnly)) {
            discardFile(options_.legacyPath, "legacy store unreadable");
            result.status = LoadStatus::Corrupted;
            return result;
        }
        QByteArray data = legacy.readAll();
        legacy.close();

        if (!NotificationStore::decodeLegacy(data, result.store)) {
            discardFile(options_.legacyPath, "legacy store malformed");
            result.store = NotificationStore{};
            result.status = LoadStatus::Corrupted;
            return result;
        }

        BOOST_LOG_TRIVIAL(info) << "[Persistence] Migrating " << result.store.notifications.size()
                                << " entries from legacy store";
        result.status = LoadStatus::Migrated;
        legacyPendingRemoval_ = true;
        markDirty();
        return result;
    }

    if (primary.size() > options_.maxFileBytes) {
        discardFile(options_.path, "exceeds size limit");
        result.status = LoadStatus::Corrupted;
        return result;
    }

    QFile file(options_.path);
    if (!file.open(QIODevice::ReadOnly)) {
        discardFile(options_.path, "cannot be opened");
        result.status = LoadStatus::Corrupted;
        return result;
    }
    QByteArray data = file.readAll();
    file.close();

    switch (NotificationStore::decode(data, result.store)) {
    case NotificationStore::DecodeStatus::Ok:
        result.status = LoadStatus::Loaded;
        BOOST_LOG_TRIVIAL(info) << "[Persistence] Loaded " << result.store.notifications.size()
                                << " entries";
        break;
    case NotificationStore::DecodeStatus::Unsupported:
        discardFile(options_.path, "unsupported format version");
        result.store = NotificationStore{};
        result.status = LoadStatus::Corrupted;
        break;
    case NotificationStore::DecodeStatus::Corrupted:
        discardFile(options_.path, "checksum or format error");
        result.store = NotificationStore{};
        result.status = LoadStatus::Corrupted;
        break;
    }
    return result;
}

} // namespace lnc
