#include <QTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <thread>
#include "core/NotifyConfig.hpp"
#include "core/notify/NotificationStore.hpp"
#include "core/platform/IosNotifier.hpp"
#include "core/platform/NullNotifier.hpp"
#include "core/services/NotificationService.hpp"

using lnc::NotificationEvent;
using lnc::NotificationRequest;
using lnc::NotificationService;
using lnc::NotificationStatus;

namespace {

NotificationRequest request(const QString& id, const QString& group = {}, qint64 delay = 3600)
{
    NotificationRequest r;
    r.title = "Title";
    r.body = "Body";
    r.identifier = id;
    r.groupKey = group;
    r.fireDelaySeconds = delay;
    return r;
}

} // namespace

class TestNotificationService : public QObject {
    Q_OBJECT
private:
    QTemporaryDir dir_;
    int run_ = 0;

    // Fresh store per test so state never leaks between cases.
    lnc::NotifyConfig makeConfig()
    {
        lnc::NotifyConfig config;
        const QString sub = QString("run%1/").arg(++run_);
        config.setStorePath(dir_.filePath(sub + "store.dat"));
        config.setLegacyStorePath(dir_.filePath(sub + "legacy.json"));
        config.setDebounceMs(20);
        config.setSaveRetryDelayMs(0);
        config.setTickIntervalMs(5);
        return config;
    }

private slots:
    void testScheduleTracksIdentifier()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QVERIFY(service.initialize());
        QSignalSpy spy(&service, &NotificationService::notificationScheduled);

        QVERIFY(service.schedule(request("welcome")));
        QVERIFY(service.isScheduled("welcome"));
        QCOMPARE(service.scheduledCount(), 1);
        QCOMPARE(service.notificationStatus("welcome"), NotificationStatus::Scheduled);
        QCOMPARE(notifier.scheduleCalls(), 1);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(service.metrics().totalScheduled, uint64_t(1));
    }

    void testGeneratedIdentifier()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QSignalSpy spy(&service, &NotificationService::notificationScheduled);

        QVERIFY(service.schedule("Hello", "World", 60));
        QCOMPARE(spy.count(), 1);
        const QString generated = spy.at(0).at(0).toString();
        QCOMPARE(generated.size(), 36);
        QVERIFY(service.isScheduled(generated));
    }

    void testInvalidRequestsRejected()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        auto noTitle = request("a");
        noTitle.title.clear();
        QVERIFY(!service.schedule(noTitle));

        auto noBody = request("b");
        noBody.body.clear();
        QVERIFY(!service.schedule(noBody));

        QVERIFY(!service.schedule(request("c", {}, -1)));
        QVERIFY(!service.schedule(request("d", {}, lnc::kMaxFireDelaySeconds + 1)));
        QVERIFY(service.schedule(request("e", {}, lnc::kMaxFireDelaySeconds)));

        QVERIFY(!service.scheduleAt("t", "b", QDateTime::currentDateTimeUtc().addSecs(-10)));
        QVERIFY(service.scheduleAt("t", "b", QDateTime::currentDateTimeUtc().addSecs(120), "at"));

        QCOMPARE(notifier.scheduleCalls(), 2);
        QCOMPARE(service.scheduledCount(), 2);
    }

    void testOldestEvictedAtCapacity()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        for (int i = 0; i < 101; ++i)
            QVERIFY(service.schedule(request(QString("n%1").arg(i), "bulk")));

        QCOMPARE(service.scheduledCount(), 100);
        QVERIFY(!service.isScheduled("n0"));
        QVERIFY(service.isScheduled("n1"));
        QVERIFY(service.isScheduled("n100"));
        QCOMPARE(service.countInGroup("bulk"), 100);
        QVERIFY(!service.membersOfGroup("bulk").contains("n0"));

        // Eviction only stops tracking; the OS copy is left alone.
        QCOMPARE(notifier.cancelCalls(), 0);
    }

    void testRescheduleReplacesPlatformCopy()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        QVERIFY(service.schedule(request("same", "g1")));
        QVERIFY(service.schedule(request("same", "g2")));

        QCOMPARE(service.scheduledCount(), 1);
        QCOMPARE(notifier.cancelledHandles(), QList<lnc::PlatformHandle>({1}));
        QCOMPARE(service.countInGroup("g1"), 0);
        QCOMPARE(service.countInGroup("g2"), 1);
    }

    void testCancel()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QSignalSpy spy(&service, &NotificationService::notificationCancelled);

        QVERIFY(service.schedule(request("a", "g")));
        service.cancel("a");

        QVERIFY(!service.isScheduled("a"));
        QCOMPARE(service.countInGroup("g"), 0);
        QCOMPARE(notifier.cancelledHandles(), QList<lnc::PlatformHandle>({1}));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(service.metrics().totalCancelled, uint64_t(1));
        QCOMPARE(service.notificationStatus("a"), NotificationStatus::Unavailable);
    }

    void testCancelUnknownIsNoOp()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QSignalSpy spy(&service, &NotificationService::notificationCancelled);

        service.cancel("never-scheduled");

        QCOMPARE(notifier.cancelCalls(), 0);
        QCOMPARE(spy.count(), 0);
        auto m = service.metrics();
        QCOMPARE(m.totalCancelled, uint64_t(0));
        QCOMPARE(m.totalErrors, uint64_t(0));
    }

    void testCircuitOpensAfterConsecutiveFailures()
    {
        lnc::NullNotifier notifier;
        auto config = makeConfig();
        config.setCircuitCooldownMs(100);
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());
        QSignalSpy errors(&service, &NotificationService::errorOccurred);

        notifier.setFailing(true);
        for (int i = 0; i < 5; ++i)
            QVERIFY(!service.schedule(request(QString("f%1").arg(i))));
        QVERIFY(service.isCircuitOpen());
        QCOMPARE(errors.count(), 5);
        QCOMPARE(service.metrics().totalErrors, uint64_t(5));

        // Rejected without reaching the platform
        QVERIFY(!service.schedule(request("sixth")));
        QCOMPARE(notifier.scheduleCalls(), 5);

        notifier.setFailing(false);
        QTRY_VERIFY(!service.isCircuitOpen());
        QVERIFY(service.schedule(request("after")));
    }

    void testSuccessResetsFailureCount()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        for (int round = 0; round < 3; ++round) {
            notifier.setFailing(true);
            for (int i = 0; i < 4; ++i)
                service.schedule(request("x"));
            notifier.setFailing(false);
            QVERIFY(service.schedule(request(QString("ok%1").arg(round))));
        }
        QVERIFY(!service.isCircuitOpen());
    }

    void testDeclinedIsNotAFailure()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        notifier.setDeclining(true);

        for (int i = 0; i < 6; ++i)
            QVERIFY(!service.schedule(request(QString("d%1").arg(i))));
        QVERIFY(!service.isCircuitOpen());
        QCOMPARE(service.scheduledCount(), 0);
    }

    void testGroups()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        QVERIFY(service.schedule(request("c", "energy")));
        QVERIFY(service.schedule(request("a", "energy")));
        QVERIFY(service.schedule(request("b", "energy")));
        QVERIFY(service.schedule(request("d", "daily")));

        QCOMPARE(service.countInGroup("energy"), 3);
        QCOMPARE(service.membersOfGroup("energy"), QStringList({"a", "b", "c"}));

        QCOMPARE(service.cancelGroup("energy"), 3);
        QCOMPARE(service.scheduledCount(), 1);
        QVERIFY(service.isScheduled("d"));
        QCOMPARE(service.countInGroup("energy"), 0);
        QCOMPARE(notifier.cancelCalls(), 3);

        QCOMPARE(service.cancelGroup("missing"), 0);
    }

    void testScheduleBatch()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        QList<NotificationRequest> batch;
        for (int i = 0; i < 60; ++i)
            batch << request(QString("b%1").arg(i), "batch");

        QCOMPARE(service.scheduleBatch(batch), 50);  // max_batch_size
        QCOMPARE(service.scheduledCount(), 50);
        QVERIFY(service.isScheduled("b49"));
        QVERIFY(!service.isScheduled("b50"));
        QCOMPARE(service.countInGroup("batch"), 50);
    }

    void testScheduleBatchSkipsInvalidAndDeduplicates()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        auto bad = request("bad");
        bad.body.clear();
        auto first = request("dup", "g1");
        auto second = request("dup", "g2");
        QList<NotificationRequest> batch{request("x"), bad, first, second};

        QCOMPARE(service.scheduleBatch(batch), 2);
        QCOMPARE(service.scheduledCount(), 2);
        QCOMPARE(service.countInGroup("g1"), 0);
        QCOMPARE(service.countInGroup("g2"), 1);
        // The first "dup" handle was superseded within the batch
        QCOMPARE(notifier.cancelledHandles(), QList<lnc::PlatformHandle>({2}));
    }

    void testBatchLargerThanRegistryKeepsGroupsInSync()
    {
        lnc::NullNotifier notifier;
        auto config = makeConfig();
        config.setMaxTracked(3);
        NotificationService service(&notifier, config);
        QSignalSpy spy(&service, &NotificationService::notificationScheduled);

        QList<NotificationRequest> batch;
        for (const char* id : {"a", "b", "c", "d", "e"})
            batch << request(id, "g");

        QCOMPARE(service.scheduleBatch(batch), 3);
        QCOMPARE(service.scheduledIdentifiers(), QStringList({"c", "d", "e"}));
        QCOMPARE(service.countInGroup("g"), 3);
        QCOMPARE(service.membersOfGroup("g"), QStringList({"c", "d", "e"}));
        QCOMPARE(service.metrics().totalScheduled, uint64_t(3));
        QCOMPARE(spy.count(), 3);

        QCOMPARE(service.cancelGroup("g"), 3);
        QCOMPARE(service.countInGroup("g"), 0);
        QCOMPARE(service.scheduledCount(), 0);
    }

    void testCancelBatchAndAll()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        for (int i = 0; i < 5; ++i)
            QVERIFY(service.schedule(request(QString("c%1").arg(i), "g")));

        QCOMPARE(service.cancelBatch({"c0", "c1", "nope"}), 2);
        QCOMPARE(service.scheduledCount(), 3);

        QSignalSpy spy(&service, &NotificationService::notificationCancelled);
        service.cancelAll();
        QCOMPARE(service.scheduledCount(), 0);
        QCOMPARE(service.countInGroup("g"), 0);
        QCOMPARE(notifier.cancelAllScheduledCalls(), 1);
        QCOMPARE(spy.count(), 3);
        QCOMPARE(service.metrics().totalCancelled, uint64_t(5));

        service.cancelAllNotifications();
        QCOMPARE(notifier.cancelAllDisplayedCalls(), 1);
    }

    void testIosPendingLimit()
    {
        lnc::IosNotifier notifier;
        NotificationService service(&notifier, makeConfig());

        for (int i = 0; i < 64; ++i)
            QVERIFY(service.schedule(request(QString("ios%1").arg(i))));
        QVERIFY(!service.schedule(request("ios64")));
        QCOMPARE(service.scheduledCount(), 64);

        // Replacing a tracked identifier does not grow the set
        QVERIFY(service.schedule(request("ios0")));
        QCOMPARE(notifier.pendingCount(), 64);
    }

    void testStatePersistsAcrossRestart()
    {
        auto config = makeConfig();
        {
            lnc::NullNotifier notifier;
            NotificationService service(&notifier, config);
            QVERIFY(service.initialize());
            QVERIFY(service.schedule(request("one")));
            QVERIFY(service.schedule(request("two")));
            QVERIFY(service.schedule(request("three")));
            service.cancel("two");
        }
        QVERIFY(QFile::exists(config.storePath()));

        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());
        QCOMPARE(service.scheduledIdentifiers(), QStringList({"one", "three"}));
    }

    void testDebouncedSave()
    {
        auto config = makeConfig();
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());

        QVERIFY(service.schedule(request("later")));
        QVERIFY(service.debugInfo().value("dirty").toBool());
        QTRY_VERIFY(QFile::exists(config.storePath()));
        QVERIFY(!service.debugInfo().value("dirty").toBool());
    }

    void testCorruptStoreStartsEmpty()
    {
        auto config = makeConfig();
        QVERIFY(QDir().mkpath(QFileInfo(config.storePath()).absolutePath()));
        QFile f(config.storePath());
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("{\"version\":2,\"payload\":{},\"checksum\":\"00\"}");
        f.close();

        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());
        QCOMPARE(service.scheduledCount(), 0);
        QVERIFY(!QFile::exists(config.storePath()));
    }

    void testLegacyStoreMigrated()
    {
        auto config = makeConfig();
        QVERIFY(QDir().mkpath(QFileInfo(config.legacyStorePath()).absolutePath()));
        QFile f(config.legacyStorePath());
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(R"({"identifiers":["old_a","old_b"],"ids":[3,4]})");
        f.close();

        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());
        QCOMPARE(service.scheduledIdentifiers(), QStringList({"old_a", "old_b"}));

        QCOMPARE(service.flushNow(), lnc::PersistenceController::FlushResult::Written);
        QVERIFY(!QFile::exists(config.legacyStorePath()));
    }

    void testCleanupExpired()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QVERIFY(service.schedule(request("a", "g")));
        QVERIFY(service.schedule(request("b", "g")));
        QVERIFY(service.schedule(request("c", "g")));

        notifier.setStatus(2, NotificationStatus::Unavailable);
        notifier.setStatus(3, NotificationStatus::Unknown);

        QCOMPARE(service.cleanupExpired(), 2);
        QCOMPARE(service.scheduledIdentifiers(), QStringList({"a"}));
        QCOMPARE(service.countInGroup("g"), 1);
        QCOMPARE(service.cleanupExpired(), 0);
    }

    void testPermission()
    {
        lnc::NullNotifier notifier;
        notifier.setPermission(false);
        NotificationService service(&notifier, makeConfig());
        QVERIFY(!service.hasPermission());
        QSignalSpy changed(&service, &NotificationService::permissionChanged);

        notifier.setPermission(true);
        bool answer = false;
        service.requestPermission([&](bool granted) { answer = granted; });
        QVERIFY(answer);
        QVERIFY(service.hasPermission());
        QCOMPARE(changed.count(), 1);

        QList<NotificationEvent::Type> seen;
        service.events().subscribe("test", [&](const NotificationEvent& e) { seen << e.type; });
        notifier.setPermission(false);
        QVERIFY(!service.refreshPermission());
        QVERIFY(!service.hasPermission());
        QCOMPARE(seen, QList<NotificationEvent::Type>({NotificationEvent::Type::PermissionDenied}));

        // Unchanged permission publishes nothing
        service.refreshPermission();
        QCOMPARE(seen.size(), 1);
    }

    void testPlatformEventsForwarded()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QList<NotificationEvent> seen;
        service.events().subscribe("test", [&](const NotificationEvent& e) { seen << e; });

        NotificationEvent tapped;
        tapped.type = NotificationEvent::Type::Tapped;
        tapped.title = "Rewards";
        notifier.simulateEvent(tapped);

        QCOMPARE(seen.size(), 1);
        QCOMPARE(seen.at(0).type, NotificationEvent::Type::Tapped);
        QCOMPARE(seen.at(0).title, QString("Rewards"));

        NotificationEvent granted;
        granted.type = NotificationEvent::Type::PermissionGranted;
        notifier.setPermission(false);
        NotificationService other(&notifier, makeConfig());
        QVERIFY(!other.hasPermission());
        notifier.simulateEvent(granted);
        QVERIFY(other.hasPermission());
    }

    void testErrorsReachSubscribersOnTick()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QVERIFY(service.initialize());

        QString operation;
        int errorEvents = 0;
        service.events().subscribeErrors("test", [&](const QString& op, const QString&) { operation = op; });
        service.events().subscribe("test", [&](const NotificationEvent& e) {
            if (e.type == NotificationEvent::Type::Error) ++errorEvents;
        });

        notifier.setFailing(true);
        QVERIFY(!service.schedule(request("x")));
        QVERIFY(operation.isEmpty());  // delivered from the queue, not inline

        QTRY_COMPARE(operation, QString("schedule"));
        QCOMPARE(errorEvents, 1);
    }

    void testShutdownFlushesEvenWithOpenCircuit()
    {
        auto config = makeConfig();
        config.setDebounceMs(60000);
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());

        QVERIFY(service.schedule(request("keep")));
        notifier.setFailing(true);
        for (int i = 0; i < 5; ++i)
            service.schedule(request("fail"));
        QVERIFY(service.isCircuitOpen());
        QVERIFY(!QFile::exists(config.storePath()));

        service.shutdown();
        QVERIFY(service.isShutdown());

        QFile f(config.storePath());
        QVERIFY(f.open(QIODevice::ReadOnly));
        lnc::NotificationStore store;
        QCOMPARE(lnc::NotificationStore::decode(f.readAll(), store), lnc::NotificationStore::DecodeStatus::Ok);
        QCOMPARE(store.notifications.size(), 1);
        QCOMPARE(store.notifications.at(0).identifier, QString("keep"));

        notifier.setFailing(false);
        QVERIFY(!service.schedule(request("late")));
        QVERIFY(!service.initialize());
    }

    void testSyncCallsRejectedOffOwnerThread()
    {
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, makeConfig());
        QVERIFY(service.schedule(request("main")));

        bool scheduled = true;
        int count = -1;
        std::thread worker([&]() {
            scheduled = service.schedule(request("worker"));
            count = service.scheduledCount();
        });
        worker.join();

        QVERIFY(!scheduled);
        QCOMPARE(count, 1);  // reads are fine from any thread
        QCOMPARE(notifier.scheduleCalls(), 1);
    }

    void testDebugInfoAndMetricsExport()
    {
        auto config = makeConfig();
        lnc::NullNotifier notifier;
        NotificationService service(&notifier, config);
        QVERIFY(service.initialize());
        QVERIFY(service.schedule(request("a", "g")));

        QVariantMap info = service.debugInfo();
        QCOMPARE(info.value("platform").toString(), QString("Null"));
        QCOMPARE(info.value("scheduledCount").toInt(), 1);
        QCOMPARE(info.value("capacity").toInt(), 100);
        QCOMPARE(info.value("groupCount").toInt(), 1);
        QCOMPARE(info.value("circuitOpen").toBool(), false);
        QCOMPARE(info.value("storePath").toString(), config.storePath());

        QVERIFY(!service.exportMetrics());  // no path configured
        const QString path = dir_.filePath("metrics.json");
        QVERIFY(service.exportMetrics(path));
        QVERIFY(QFile::exists(path));

        service.resetMetrics();
        QCOMPARE(service.metrics().totalScheduled, uint64_t(0));
    }
};

QTEST_MAIN(TestNotificationService)
#include "test_notification_service.moc"
