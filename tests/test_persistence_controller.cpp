#include <QTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <thread>
#include "core/notify/CircuitBreaker.hpp"
#include "core/notify/Metrics.hpp"
#include "core/notify/PersistenceController.hpp"

using lnc::NotificationStore;
using lnc::PersistenceController;

class TestPersistenceController : public QObject {
    Q_OBJECT
private:
    QTemporaryDir dir_;
    NotificationStore state_;
    lnc::CircuitBreaker breaker_{5};
    lnc::Metrics metrics_;

    PersistenceController::Options options(const QString& name) const
    {
        PersistenceController::Options o;
        o.path = dir_.filePath(name + "/store.dat");
        o.legacyPath = dir_.filePath(name + "/legacy.json");
        o.debounceMs = 20;
        o.retryAttempts = 2;
        o.retryDelayMs = 0;
        return o;
    }

    PersistenceController::SnapshotProvider provider()
    {
        return [this]() { return state_; };
    }

    static void writeRaw(const QString& path, const QByteArray& data)
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(data);
    }

private slots:
    void init()
    {
        state_ = NotificationStore{};
        state_.notifications = {{"a", 1}, {"b", 2}};
        state_.lastForegroundUnixTime = 1234;
        breaker_.reset();
        metrics_.reset();
    }

    void testMissingFileIsFirstRun()
    {
        PersistenceController pc(options("missing"), provider(), &breaker_, &metrics_);
        auto r = pc.load();
        QCOMPARE(r.status, PersistenceController::LoadStatus::Missing);
        QVERIFY(r.store.isEmpty());
        QVERIFY(!pc.isDirty());
    }

    void testFlushThenLoad()
    {
        auto o = options("roundtrip");
        {
            PersistenceController pc(o, provider(), &breaker_, &metrics_);
            pc.markDirty();
            QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::Written);
            QVERIFY(!pc.isDirty());
            QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::NotDirty);
        }
        QVERIFY(QFile::exists(o.path));
        QCOMPARE(metrics_.snapshot().saveCount, uint64_t(1));

        PersistenceController reader(o, {}, &breaker_, &metrics_);
        auto r = reader.load();
        QCOMPARE(r.status, PersistenceController::LoadStatus::Loaded);
        QCOMPARE(r.store.notifications, state_.notifications);
        QCOMPARE(r.store.lastForegroundUnixTime, qint64(1234));
    }

    void testDebounceCollapsesBursts()
    {
        PersistenceController pc(options("debounce"), provider(), &breaker_, &metrics_);
        QSignalSpy spy(&pc, &PersistenceController::flushed);

        for (int i = 0; i < 10; ++i)
            pc.markDirty();
        QVERIFY(pc.isDebouncePending());
        QCOMPARE(spy.count(), 0);

        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toBool(), true);
        QVERIFY(!pc.isDirty());

        QTest::qWait(60);
        QCOMPARE(spy.count(), 1);
    }

    void testMarkDirtyFromWorkerThread()
    {
        PersistenceController pc(options("thread"), provider(), &breaker_, &metrics_);
        QSignalSpy spy(&pc, &PersistenceController::flushed);

        std::thread worker([&pc]() { pc.markDirty(); });
        worker.join();
        QVERIFY(pc.isDirty());

        QTRY_COMPARE(spy.count(), 1);
    }

    void testCorruptedFileIsDiscarded()
    {
        auto o = options("corrupt");
        {
            PersistenceController pc(o, provider(), &breaker_, &metrics_);
            pc.markDirty();
            QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::Written);
        }

        QFile f(o.path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        QByteArray data = f.readAll();
        f.close();
        data[data.size() / 2] = static_cast<char>(data.at(data.size() / 2) ^ 0x01);
        writeRaw(o.path, data);

        PersistenceController pc(o, provider(), &breaker_, &metrics_);
        auto r = pc.load();
        QCOMPARE(r.status, PersistenceController::LoadStatus::Corrupted);
        QVERIFY(r.store.isEmpty());
        QVERIFY(!QFile::exists(o.path));
    }

    void testOversizedFileIsDiscarded()
    {
        auto o = options("oversized");
        o.maxFileBytes = 16;
        {
            PersistenceController pc(o, provider(), &breaker_, &metrics_);
            pc.markDirty();
            pc.flushNow();
        }
        PersistenceController pc(o, provider(), &breaker_, &metrics_);
        QCOMPARE(pc.load().status, PersistenceController::LoadStatus::Corrupted);
        QVERIFY(!QFile::exists(o.path));
    }

    void testLegacyMigration()
    {
        auto o = options("legacy");
        QVERIFY(QDir().mkpath(QFileInfo(o.legacyPath).absolutePath()));
        writeRaw(o.legacyPath, R"({"identifiers":["x","y"],"ids":[10,20]})");

        NotificationStore migrated;
        PersistenceController pc(o, [&migrated]() { return migrated; }, &breaker_, &metrics_);
        auto r = pc.load();
        QCOMPARE(r.status, PersistenceController::LoadStatus::Migrated);
        QCOMPARE(r.store.notifications.size(), 2);
        QVERIFY(pc.isDirty());

        migrated = r.store;
        QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::Written);
        QVERIFY(QFile::exists(o.path));
        QVERIFY(!QFile::exists(o.legacyPath));

        PersistenceController reader(o, {}, &breaker_, &metrics_);
        QCOMPARE(reader.load().status, PersistenceController::LoadStatus::Loaded);
    }

    void testWriteFailureKeepsDirty()
    {
        PersistenceController::Options o;
        o.path = "/proc/notifcore-test/store.dat";
        o.retryAttempts = 3;
        o.retryDelayMs = 0;

        PersistenceController pc(o, provider(), &breaker_, &metrics_);
        QSignalSpy spy(&pc, &PersistenceController::flushed);
        pc.markDirty();

        QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::Failed);
        QVERIFY(pc.isDirty());
        QCOMPARE(breaker_.consecutiveFailures(), 1);
        QCOMPARE(metrics_.snapshot().totalErrors, uint64_t(1));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toBool(), false);
    }

    void testOpenCircuitPostponesSave()
    {
        lnc::CircuitBreaker breaker(1);
        breaker.recordFailure();
        QVERIFY(breaker.isOpen());

        auto o = options("circuit");
        PersistenceController pc(o, provider(), &breaker, &metrics_);
        pc.markDirty();
        QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::CircuitOpen);
        QVERIFY(pc.isDirty());
        QVERIFY(!QFile::exists(o.path));

        breaker.reset();
        QCOMPARE(pc.flushNow(), PersistenceController::FlushResult::Written);
    }
};

QTEST_MAIN(TestPersistenceController)
#include "test_persistence_controller.moc"
