#include <QTest>
#include <stdexcept>
#include "core/notify/MainThreadQueue.hpp"
#include "core/notify/Metrics.hpp"
#include "core/services/EventAggregator.hpp"

using lnc::EventAggregator;
using lnc::NotificationEvent;

class TestEventAggregator : public QObject {
    Q_OBJECT
private slots:
    void testSubscribeAndPublish()
    {
        lnc::MainThreadQueue queue;
        EventAggregator events(&queue, nullptr);
        NotificationEvent received;
        int subId = events.subscribe("test", [&](const NotificationEvent& e) { received = e; });

        events.publish(NotificationEvent::Type::Received, "Title", "Body");

        QVERIFY(subId > 0);
        QCOMPARE(received.type, NotificationEvent::Type::Received);
        QCOMPARE(received.title, QString("Title"));
        QCOMPARE(received.body, QString("Body"));
        QVERIFY(received.timestamp.isValid());
    }

    void testUnsubscribe()
    {
        EventAggregator events(nullptr, nullptr);
        int count = 0;
        int subId = events.subscribe("counter", [&](const NotificationEvent&) { ++count; });

        events.publish(NotificationEvent::Type::Tapped);
        QCOMPARE(count, 1);

        events.unsubscribe(subId);
        events.publish(NotificationEvent::Type::Tapped);
        QCOMPARE(count, 1);
        QCOMPARE(events.subscriberCount(), 0);
    }

    void testThrowingSubscriberIsIsolated()
    {
        EventAggregator events(nullptr, nullptr);
        QStringList order;
        events.subscribe("first", [&](const NotificationEvent&) { order << "first"; });
        events.subscribe("broken", [](const NotificationEvent&) { throw std::runtime_error("bad handler"); });
        events.subscribe("odd", [](const NotificationEvent&) { throw 42; });
        events.subscribe("last", [&](const NotificationEvent&) { order << "last"; });

        events.publish(NotificationEvent::Type::Received);
        QCOMPARE(order, QStringList({"first", "last"}));
    }

    void testEventsAreRecycled()
    {
        lnc::Metrics metrics;
        EventAggregator events(nullptr, &metrics, 4);
        events.subscribe("a", [](const NotificationEvent&) {});
        events.subscribe("b", [](const NotificationEvent&) {});

        events.publish(NotificationEvent::Type::Received, "x");
        events.publish(NotificationEvent::Type::Received, "y");

        auto snap = metrics.snapshot();
        QCOMPARE(snap.poolMisses, uint64_t(1));
        QCOMPARE(snap.poolHits, uint64_t(3));
        QCOMPARE(events.pooledEvents(), size_t(1));
    }

    void testErrorsGoThroughQueue()
    {
        lnc::MainThreadQueue queue;
        EventAggregator events(&queue, nullptr);

        QString op, msg;
        NotificationEvent::Type lastType = NotificationEvent::Type::Received;
        events.subscribeErrors("errors", [&](const QString& o, const QString& m) { op = o; msg = m; });
        events.subscribe("events", [&](const NotificationEvent& e) { lastType = e.type; });

        events.publishError("schedule", "platform down");
        QVERIFY(op.isEmpty());
        QCOMPARE(queue.size(), 1);

        queue.drain(10, -1);
        QCOMPARE(op, QString("schedule"));
        QCOMPARE(msg, QString("platform down"));
        QCOMPARE(lastType, NotificationEvent::Type::Error);
    }

    void testThrowingErrorSubscriberIsIsolated()
    {
        EventAggregator events(nullptr, nullptr);
        int delivered = 0;
        events.subscribeErrors("broken", [](const QString&, const QString&) { throw std::runtime_error("x"); });
        events.subscribeErrors("odd", [](const QString&, const QString&) { throw 42; });
        events.subscribeErrors("ok", [&](const QString&, const QString&) { ++delivered; });

        // No queue: delivered inline
        events.publishError("cancel", "oops");
        QCOMPARE(delivered, 1);
    }

    void testSubscribersRunInSubscriptionOrder()
    {
        EventAggregator events(nullptr, nullptr);
        QList<int> order;
        for (int i = 0; i < 5; ++i)
            events.subscribe(QString::number(i), [&order, i](const NotificationEvent&) { order << i; });
        events.publish(NotificationEvent::Type::Received);
        QCOMPARE(order, QList<int>({0, 1, 2, 3, 4}));
    }

    void testClear()
    {
        EventAggregator events(nullptr, nullptr);
        events.subscribe("a", [](const NotificationEvent&) {});
        events.subscribeErrors("b", [](const QString&, const QString&) {});
        events.clear();
        QCOMPARE(events.subscriberCount(), 0);
        QCOMPARE(events.errorSubscriberCount(), 0);
    }
};

QTEST_MAIN(TestEventAggregator)
#include "test_event_aggregator.moc"
