/**
 * @file test_merger.cpp
 * @brief Unit tests for FileMerger
 */

#include <QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "chunkfetch/engine/FileMerger.h"

using namespace ChunkFetch;

namespace {

QString writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return QString();
    }
    file.write(content);
    return path;
}

QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

class TestMerger : public QObject
{
    Q_OBJECT

private slots:
    void testMergeInGivenOrder();
    void testMergeCreatesParentDirectories();
    void testMergeLargerThanBuffer();
    void testMissingInputFails();
    void testUnwritableOutputFails();
    void testEmptyInputList();
};

void TestMerger::testMergeInGivenOrder()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString a = writeFile(dir.filePath(QStringLiteral("chunk_0")), "AB");
    const QString b = writeFile(dir.filePath(QStringLiteral("chunk_1")), "CDE");
    QVERIFY(!a.isEmpty() && !b.isEmpty());

    const QString output = dir.filePath(QStringLiteral("out.bin"));
    DownloadError error = FileMerger::merge(output, {a, b});

    QVERIFY2(!error.hasError(), qPrintable(error.toString()));
    QCOMPARE(readFile(output), QByteArray("ABCDE"));

    // Order follows the list, not file creation time
    error = FileMerger::merge(output, {b, a});
    QVERIFY(!error.hasError());
    QCOMPARE(readFile(output), QByteArray("CDEAB"));
}

void TestMerger::testMergeCreatesParentDirectories()
{
    QTemporaryDir dir;
    const QString part = writeFile(dir.filePath(QStringLiteral("chunk_0")), "xyz");

    const QString output = dir.filePath(QStringLiteral("nested/deeper/out.bin"));
    DownloadError error = FileMerger::merge(output, {part});

    QVERIFY(!error.hasError());
    QCOMPARE(readFile(output), QByteArray("xyz"));
}

void TestMerger::testMergeLargerThanBuffer()
{
    QTemporaryDir dir;

    QByteArray first(Constants::FILE_BUFFER_SIZE * 2 + 17, 'a');
    QByteArray second(Constants::FILE_BUFFER_SIZE + 1, 'b');
    const QString a = writeFile(dir.filePath(QStringLiteral("chunk_0")), first);
    const QString b = writeFile(dir.filePath(QStringLiteral("chunk_1")), second);

    const QString output = dir.filePath(QStringLiteral("out.bin"));
    QVERIFY(!FileMerger::merge(output, {a, b}).hasError());
    QCOMPARE(readFile(output), first + second);
}

void TestMerger::testMissingInputFails()
{
    QTemporaryDir dir;
    const QString a = writeFile(dir.filePath(QStringLiteral("chunk_0")), "AB");
    const QString missing = dir.filePath(QStringLiteral("chunk_1"));

    const QString output = dir.filePath(QStringLiteral("out.bin"));
    DownloadError error = FileMerger::merge(output, {a, missing});

    QCOMPARE(error.category, ErrorCategory::MergeFailed);
    QVERIFY(error.details.contains(missing));

    // The partial output stays for the caller to clean up
    QVERIFY(QFile::exists(output));
    QCOMPARE(readFile(output), QByteArray("AB"));
}

void TestMerger::testUnwritableOutputFails()
{
    QTemporaryDir dir;
    const QString a = writeFile(dir.filePath(QStringLiteral("chunk_0")), "AB");

    // A directory already sits at the output path
    const QString output = dir.filePath(QStringLiteral("taken"));
    QVERIFY(QDir().mkpath(output));

    DownloadError error = FileMerger::merge(output, {a});
    QCOMPARE(error.category, ErrorCategory::MergeFailed);
}

void TestMerger::testEmptyInputList()
{
    QTemporaryDir dir;
    const QString output = dir.filePath(QStringLiteral("empty.bin"));

    QVERIFY(!FileMerger::merge(output, {}).hasError());
    QVERIFY(QFile::exists(output));
    QCOMPARE(QFileInfo(output).size(), qint64(0));
}

QTEST_GUILESS_MAIN(TestMerger)
#include "test_merger.moc"
