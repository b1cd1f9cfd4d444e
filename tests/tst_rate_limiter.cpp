#include <QTest>
#include <QThread>
#include <atomic>
#include "gateway/rate_limiter.h"

class TestRateLimiter : public QObject {
    Q_OBJECT

private slots:
    void testStartsFullAndDrains() {
        qint64 now = 0;
        RateLimiter limiter({10.0, 3}, [&now]() { return now; });
        QVERIFY(limiter.tryAcquire());
        QVERIFY(limiter.tryAcquire());
        QVERIFY(limiter.tryAcquire());
        QVERIFY(!limiter.tryAcquire());
    }

    void testRefillsAtConfiguredRate() {
        qint64 now = 0;
        RateLimiter limiter({2.0, 2}, [&now]() { return now; });
        QVERIFY(limiter.tryAcquire());
        QVERIFY(limiter.tryAcquire());
        QVERIFY(!limiter.tryAcquire());

        now += 250;   // half a token
        QVERIFY(!limiter.tryAcquire());
        now += 250;   // one token
        QVERIFY(limiter.tryAcquire());
        QVERIFY(!limiter.tryAcquire());
    }

    void testRefillIsCappedAtBurst() {
        qint64 now = 0;
        RateLimiter limiter({100.0, 5}, [&now]() { return now; });
        for (int i = 0; i < 5; ++i)
            QVERIFY(limiter.tryAcquire());

        now += 60 * 1000;
        QCOMPARE(limiter.availableTokens(), 5.0);
        int granted = 0;
        while (limiter.tryAcquire())
            ++granted;
        QCOMPARE(granted, 5);
    }

    void testBurstThenReject() {
        qint64 now = 0;
        RateLimiter limiter({1.0, 20}, [&now]() { return now; });
        int granted = 0;
        for (int i = 0; i < 25; ++i) {
            if (limiter.tryAcquire())
                ++granted;
        }
        QCOMPARE(granted, 20);
    }

    void testConcurrentAcquireNeverOvergrants() {
        qint64 now = 0;   // frozen clock: no refill
        RateLimiter limiter({1.0, 500}, [&now]() { return now; });
        std::atomic<int> granted{0};

        QList<QThread*> threads;
        for (int t = 0; t < 8; ++t) {
            threads.append(QThread::create([&]() {
                for (int i = 0; i < 200; ++i) {
                    if (limiter.tryAcquire())
                        ++granted;
                }
            }));
        }
        for (QThread* thread : threads)
            thread->start();
        for (QThread* thread : threads) {
            QVERIFY(thread->wait(30000));
            delete thread;
        }
        QCOMPARE(granted.load(), 500);
    }

    void testDefaultClockRefills() {
        RateLimiter limiter({50.0, 1});
        QVERIFY(limiter.tryAcquire());
        QVERIFY(!limiter.tryAcquire());
        QTRY_VERIFY_WITH_TIMEOUT(limiter.tryAcquire(), 2000);
    }
};

QTEST_MAIN(TestRateLimiter)
#include "tst_rate_limiter.moc"
