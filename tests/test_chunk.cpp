/**
 * @file test_chunk.cpp
 * @brief Unit tests for Chunk state and its lock discipline
 */

#include <QtTest>

#include <atomic>

#include <QFile>
#include <QTemporaryDir>
#include <QThreadPool>

#include "chunkfetch/engine/Chunk.h"

using namespace ChunkFetch;

class TestChunk : public QObject
{
    Q_OBJECT

private slots:
    void testGeometry();
    void testTempFilePathIsDeterministic();
    void testProgressCompletesAtExactSize();
    void testProgressBelowSizeStaysIncomplete();
    void testMarkFailedCountsAttempts();
    void testResetForRetryKeepsRetryCount();
    void testResetForRetryWithoutTempFile();
    void testIsGoodRequiresCompletedAndNotFailed();
    void testConcurrentProgressUpdates();
};

void TestChunk::testGeometry()
{
    Chunk chunk(3, 1000, 1999, QStringLiteral("/tmp/x"));

    QCOMPARE(chunk.index(), 3);
    QCOMPARE(chunk.size(), ByteCount(1000));
    QCOMPARE(chunk.rangeHeader(), QString("bytes=1000-1999"));

    Chunk single(0, 7, 7, QStringLiteral("/tmp/x"));
    QCOMPARE(single.size(), ByteCount(1));
}

void TestChunk::testTempFilePathIsDeterministic()
{
    Chunk a(2, 0, 9, QStringLiteral("/tmp/dl"));
    Chunk b(2, 10, 19, QStringLiteral("/tmp/dl"));

    QCOMPARE(a.tempFilePath(), b.tempFilePath());
    QCOMPARE(a.tempFilePath(), chunkTempFilePath(QStringLiteral("/tmp/dl"), 2));
    QVERIFY(a.tempFilePath() != chunkTempFilePath(QStringLiteral("/tmp/dl"), 3));
}

void TestChunk::testProgressCompletesAtExactSize()
{
    Chunk chunk(0, 0, 99, QStringLiteral("/tmp/x"));

    chunk.updateProgress(40);
    chunk.updateProgress(60);

    QCOMPARE(chunk.downloaded(), ByteCount(100));
    QVERIFY(chunk.isCompleted());
    QCOMPARE(chunk.progress(), 100.0);
}

void TestChunk::testProgressBelowSizeStaysIncomplete()
{
    Chunk chunk(0, 0, 99, QStringLiteral("/tmp/x"));

    chunk.updateProgress(50);
    chunk.updateProgress(49);

    QCOMPARE(chunk.downloaded(), ByteCount(99));
    QVERIFY(!chunk.isCompleted());
    QVERIFY(!chunk.isGood());
}

void TestChunk::testMarkFailedCountsAttempts()
{
    Chunk chunk(0, 0, 99, QStringLiteral("/tmp/x"));

    chunk.markFailed(QStringLiteral("connection reset"));
    QVERIFY(chunk.isFailed());
    QCOMPARE(chunk.retryCount(), 1);
    QCOMPARE(chunk.lastError(), QString("connection reset"));

    chunk.markFailed();
    QCOMPARE(chunk.retryCount(), 2);
}

void TestChunk::testResetForRetryKeepsRetryCount()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    Chunk chunk(1, 0, 9, dir.path());

    QFile file(chunk.tempFilePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("abcd");
    file.close();

    chunk.updateProgress(4);
    chunk.markFailed(QStringLiteral("boom"));
    chunk.markFailed(QStringLiteral("boom again"));

    chunk.resetForRetry();

    QCOMPARE(chunk.downloaded(), ByteCount(0));
    QVERIFY(!chunk.isFailed());
    QVERIFY(!chunk.isCompleted());
    QCOMPARE(chunk.retryCount(), 2);
    QVERIFY(!QFile::exists(chunk.tempFilePath()));
}

void TestChunk::testResetForRetryWithoutTempFile()
{
    QTemporaryDir dir;
    Chunk chunk(0, 0, 9, dir.path());

    chunk.markFailed();
    chunk.resetForRetry();

    QVERIFY(!chunk.isFailed());
    QCOMPARE(chunk.retryCount(), 1);
}

void TestChunk::testIsGoodRequiresCompletedAndNotFailed()
{
    Chunk chunk(0, 0, 9, QStringLiteral("/tmp/x"));
    chunk.updateProgress(10);
    QVERIFY(chunk.isGood());

    chunk.markFailed();
    QVERIFY(chunk.isCompleted());
    QVERIFY(!chunk.isGood());

    auto state = chunk.snapshot();
    QCOMPARE(state.index, 0);
    QCOMPARE(state.downloaded, ByteCount(10));
    QVERIFY(state.completed);
    QVERIFY(state.failed);
    QCOMPARE(state.retryCount, 1);
}

void TestChunk::testConcurrentProgressUpdates()
{
    constexpr int WRITERS = 8;
    constexpr int UPDATES = 1000;

    Chunk chunk(0, 0, WRITERS * UPDATES - 1, QStringLiteral("/tmp/x"));

    QThreadPool pool;
    pool.setMaxThreadCount(WRITERS + 1);

    for (int i = 0; i < WRITERS; ++i) {
        pool.start([&chunk]() {
            for (int n = 0; n < UPDATES; ++n) {
                chunk.updateProgress(1);
            }
        });
    }

    // A reader never sees more than what has been added
    std::atomic<bool> consistent{true};
    pool.start([&chunk, &consistent]() {
        ByteCount last = 0;
        while (!chunk.isCompleted()) {
            ByteCount now = chunk.downloaded();
            if (now < last || now > chunk.size()) {
                consistent = false;
            }
            last = now;
        }
    });

    pool.waitForDone();

    QVERIFY(consistent);
    QCOMPARE(chunk.downloaded(), ByteCount(WRITERS * UPDATES));
    QVERIFY(chunk.isCompleted());
}

QTEST_GUILESS_MAIN(TestChunk)
#include "test_chunk.moc"
