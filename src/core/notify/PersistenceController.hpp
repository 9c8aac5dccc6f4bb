#pragma once

#include "core/notify/NotificationStore.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <functional>

namespace lnc {

class CircuitBreaker;
class Metrics;

/**
 * Debounced, crash-safe persistence of the NotificationStore.
 *
 * markDirty() may be called from any thread; it restarts a single-shot
 * debounce timer on the owner thread so bursts of changes collapse into
 * one write. Writes go through QSaveFile (temp file + rename), so a crash
 * leaves either the old or the new file, never a torn one.
 *
 * A failed write is retried a few times; if all attempts fail the circuit
 * breaker is told and the state stays dirty for the next flush.
 */
class PersistenceController : public QObject {
    Q_OBJECT
public:
    struct Options {
        QString path;
        QString legacyPath;              // optional pre-checksum store to migrate
        int debounceMs = 500;
        int retryAttempts = 3;
        int retryDelayMs = 100;
        qint64 maxFileBytes = 5 * 1024 * 1024;
    };

    enum class FlushResult {
        NotDirty,
        CircuitOpen,
        Written,
        Failed
    };

    enum class LoadStatus {
        Missing,     // first run
        Loaded,
        Migrated,    // read from the legacy path
        Corrupted    // discarded, starting empty
    };

    struct LoadResult {
        LoadStatus status = LoadStatus::Missing;
        NotificationStore store;
    };

    using SnapshotProvider = std::function<NotificationStore()>;

    PersistenceController(Options options, SnapshotProvider snapshot,
                          CircuitBreaker* breaker, Metrics* metrics,
                          QObject* parent = nullptr);

    void markDirty();
    bool isDirty() const { return dirty_.load(); }
    bool isDebouncePending() const { return debounce_.isActive(); }

    FlushResult flush();
    /// Cancel any pending debounce and flush immediately.
    FlushResult flushNow();

    LoadResult load();

    const Options& options() const { return options_; }

signals:
    void flushed(bool success);

private:
    bool writeFile(const QByteArray& data, QString& error) const;
    void discardFile(const QString& path, const char* reason) const;

    Options options_;
    SnapshotProvider snapshot_;
    CircuitBreaker* breaker_;
    Metrics* metrics_;

    std::atomic<bool> dirty_{false};
    bool legacyPendingRemoval_ = false;
    QTimer debounce_;
};

} // namespace lnc
