#include <QTest>
#include <chrono>
#include "core/notify/CircuitBreaker.hpp"

using lnc::CircuitBreaker;
using namespace std::chrono_literals;

class TestCircuitBreaker : public QObject {
    Q_OBJECT
private:
    std::chrono::steady_clock::time_point now_{};

    CircuitBreaker makeBreaker(int threshold = 5)
    {
        now_ = std::chrono::steady_clock::time_point{} + 1h;
        return CircuitBreaker(threshold, 60000ms, [this]() { return now_; });
    }

private slots:
    void testOpensOnThreshold()
    {
        auto breaker = makeBreaker();
        for (int i = 0; i < 4; ++i)
            QVERIFY(!breaker.recordFailure());
        QVERIFY(!breaker.isOpen());

        QVERIFY(breaker.recordFailure());
        QVERIFY(breaker.isOpen());
        QCOMPARE(breaker.consecutiveFailures(), 5);

        // Further failures while open do not re-open
        QVERIFY(!breaker.recordFailure());
    }

    void testSuccessResetsCount()
    {
        auto breaker = makeBreaker();
        for (int i = 0; i < 4; ++i)
            breaker.recordFailure();
        breaker.recordSuccess();
        QCOMPARE(breaker.consecutiveFailures(), 0);

        for (int i = 0; i < 4; ++i)
            breaker.recordFailure();
        QVERIFY(!breaker.isOpen());
    }

    void testClosesAfterCooldown()
    {
        auto breaker = makeBreaker();
        for (int i = 0; i < 5; ++i)
            breaker.recordFailure();
        QVERIFY(breaker.isOpen());

        now_ += 59999ms;
        QVERIFY(!breaker.tick());
        QVERIFY(breaker.isOpen());

        now_ += 1ms;
        QVERIFY(breaker.tick());
        QVERIFY(!breaker.isOpen());
        QCOMPARE(breaker.consecutiveFailures(), 0);

        // Already closed
        QVERIFY(!breaker.tick());
    }

    void testCooldownMeasuredFromOpening()
    {
        auto breaker = makeBreaker();
        for (int i = 0; i < 5; ++i)
            breaker.recordFailure();

        now_ += 30s;
        breaker.recordFailure();  // must not push the deadline out
        now_ += 30s;
        QVERIFY(breaker.tick());
    }

    void testReset()
    {
        auto breaker = makeBreaker(1);
        QVERIFY(breaker.recordFailure());
        breaker.reset();
        QVERIFY(!breaker.isOpen());
        QCOMPARE(breaker.consecutiveFailures(), 0);
    }

    void testDefaults()
    {
        CircuitBreaker breaker;
        QCOMPARE(breaker.threshold(), 5);
        QVERIFY(breaker.cooldown() == 60000ms);
    }
};

QTEST_MAIN(TestCircuitBreaker)
#include "test_circuit_breaker.moc"
