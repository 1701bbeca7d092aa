/**
 * @file test_planner.cpp
 * @brief Unit tests for ChunkPlanner and chunk validation
 */

#include <QtTest>

#include "chunkfetch/engine/ChunkPlanner.h"

using namespace ChunkFetch;

namespace {

// Ranges must be contiguous, disjoint and cover [0, length - 1]
bool coversExactly(const DownloadPlan& plan, ByteCount length)
{
    ByteOffset expectedStart = 0;
    for (size_t i = 0; i < plan.size(); ++i) {
        const Chunk* chunk = plan.chunk(i);
        if (chunk->index() != static_cast<ChunkIndex>(i)) return false;
        if (chunk->startByte() != expectedStart) return false;
        if (chunk->endByte() < chunk->startByte()) return false;
        expectedStart = chunk->endByte() + 1;
    }
    return expectedStart == length;
}

} // namespace

class TestPlanner : public QObject
{
    Q_OBJECT

private slots:
    void testCoverage_data();
    void testCoverage();
    void testLastChunkAbsorbsRemainder();
    void testNonPositiveThreadsMeansOneChunk();
    void testMoreThreadsThanBytes();
    void testInvalidSize();
    void testTempFilePathsInIndexOrder();
    void testValidateChunks();
};

void TestPlanner::testCoverage_data()
{
    QTest::addColumn<qint64>("length");
    QTest::addColumn<int>("threads");

    QTest::newRow("even split") << qint64(10000) << 4;
    QTest::newRow("remainder") << qint64(10003) << 4;
    QTest::newRow("single byte") << qint64(1) << 8;
    QTest::newRow("prime length") << qint64(7919) << 16;
    QTest::newRow("one thread") << qint64(123456) << 1;
    QTest::newRow("large") << qint64(5'000'000'000) << 12;
}

void TestPlanner::testCoverage()
{
    QFETCH(qint64, length);
    QFETCH(int, threads);

    DownloadError error;
    auto plan = ChunkPlanner::plan(length, threads, QStringLiteral("/tmp/plan"), &error);

    QVERIFY(plan);
    QVERIFY(!error.hasError());
    QCOMPARE(plan->contentLength(), length);
    QCOMPARE(static_cast<int>(plan->size()), ChunkPlanner::effectiveChunkCount(length, threads));
    QVERIFY(coversExactly(*plan, length));
    QCOMPARE(plan->chunk(plan->size() - 1)->endByte(), length - 1);
}

void TestPlanner::testLastChunkAbsorbsRemainder()
{
    auto plan = ChunkPlanner::plan(10, 3, QStringLiteral("/tmp/plan"));

    QVERIFY(plan);
    QCOMPARE(plan->size(), size_t(3));
    QCOMPARE(plan->chunk(0)->size(), ByteCount(3));
    QCOMPARE(plan->chunk(1)->size(), ByteCount(3));
    QCOMPARE(plan->chunk(2)->size(), ByteCount(4));
    QCOMPARE(plan->chunk(2)->startByte(), ByteOffset(6));
    QCOMPARE(plan->chunk(2)->endByte(), ByteOffset(9));
}

void TestPlanner::testNonPositiveThreadsMeansOneChunk()
{
    for (int threads : {0, -1, -64}) {
        auto plan = ChunkPlanner::plan(1000, threads, QStringLiteral("/tmp/plan"));
        QVERIFY(plan);
        QCOMPARE(plan->size(), size_t(1));
        QCOMPARE(plan->chunk(0)->startByte(), ByteOffset(0));
        QCOMPARE(plan->chunk(0)->endByte(), ByteOffset(999));
    }
}

void TestPlanner::testMoreThreadsThanBytes()
{
    auto plan = ChunkPlanner::plan(5, 32, QStringLiteral("/tmp/plan"));

    QVERIFY(plan);
    QCOMPARE(plan->size(), size_t(5));
    for (size_t i = 0; i < plan->size(); ++i) {
        QCOMPARE(plan->chunk(i)->size(), ByteCount(1));
    }
}

void TestPlanner::testInvalidSize()
{
    for (ByteCount length : {ByteCount(0), ByteCount(-1)}) {
        DownloadError error;
        auto plan = ChunkPlanner::plan(length, 4, QStringLiteral("/tmp/plan"), &error);

        QVERIFY(!plan);
        QCOMPARE(error.category, ErrorCategory::PlanInvalid);
        QVERIFY(error.message.contains(QString::number(length)));
    }

    QCOMPARE(ChunkPlanner::effectiveChunkCount(0, 4), 0);
}

void TestPlanner::testTempFilePathsInIndexOrder()
{
    auto plan = ChunkPlanner::plan(100, 4, QStringLiteral("/tmp/plan"));
    QVERIFY(plan);

    const QStringList paths = plan->tempFilePaths();
    QCOMPARE(paths.size(), 4);
    for (int i = 0; i < paths.size(); ++i) {
        QCOMPARE(paths.at(i), chunkTempFilePath(QStringLiteral("/tmp/plan"), i));
    }
}

void TestPlanner::testValidateChunks()
{
    auto plan = ChunkPlanner::plan(40, 4, QStringLiteral("/tmp/plan"));
    QVERIFY(plan);

    auto chunks = plan->chunks();
    QVERIFY(!validateChunks(chunks));

    for (Chunk* chunk : chunks) {
        chunk->updateProgress(chunk->size());
    }
    QVERIFY(validateChunks(chunks));

    // One incomplete chunk among N
    chunks[2]->resetForRetry();
    QVERIFY(!validateChunks(chunks));

    // Completed but flagged failed
    chunks[2]->updateProgress(chunks[2]->size());
    chunks[2]->markFailed();
    QVERIFY(!validateChunks(chunks));
}

QTEST_GUILESS_MAIN(TestPlanner)
#include "test_planner.moc"
