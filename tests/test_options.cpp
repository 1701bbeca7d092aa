/**
 * @file test_options.cpp
 * @brief Unit tests for DownloadOptions and the error value
 */

#include <QtTest>

#include <QSettings>
#include <QTemporaryDir>
#include <QThread>

#include "chunkfetch/engine/DownloadOptions.h"

using namespace ChunkFetch;

class TestOptions : public QObject
{
    Q_OBJECT

private slots:
    void testDefaults();
    void testOutputPathFromUrl_data();
    void testOutputPathFromUrl();
    void testExplicitOutputPathWins();
    void testThreadCountResolution();
    void testLoadSettings();
    void testMissingKeysKeepValues();
    void testErrorToString();
    void testErrorWrapKeepsCause();
};

void TestOptions::testDefaults()
{
    DownloadOptions options = DownloadOptions::defaults();

    QCOMPARE(options.maxRetries, 3);
    QVERIFY(options.verbose);
    QVERIFY(options.threadCount >= 1);
    QCOMPARE(options.fetch.attempts, 3);
    QCOMPARE(options.fetch.retryDelay.count(), Duration::rep(2000));
    QCOMPARE(options.fetch.connectTimeoutSeconds, 30);
}

void TestOptions::testOutputPathFromUrl_data()
{
    QTest::addColumn<QString>("url");
    QTest::addColumn<QString>("expected");

    QTest::newRow("file name")
        << QString("http://example.com/files/archive.tar.gz") << QString("archive.tar.gz");
    QTest::newRow("query ignored")
        << QString("http://example.com/a/b.iso?token=1") << QString("b.iso");
    QTest::newRow("trailing slash")
        << QString("http://example.com/dir/") << QString("download");
    QTest::newRow("host only")
        << QString("http://example.com") << QString("download");
}

void TestOptions::testOutputPathFromUrl()
{
    QFETCH(QString, url);
    QFETCH(QString, expected);

    DownloadOptions options;
    options.url = QUrl(url);

    QCOMPARE(options.resolvedOutputPath(), expected);
}

void TestOptions::testExplicitOutputPathWins()
{
    DownloadOptions options;
    options.url = QUrl(QStringLiteral("http://example.com/file.bin"));
    options.outputPath = QStringLiteral("/tmp/other.bin");

    QCOMPARE(options.resolvedOutputPath(), QString("/tmp/other.bin"));
}

void TestOptions::testThreadCountResolution()
{
    DownloadOptions options;

    options.threadCount = 6;
    QCOMPARE(options.resolvedThreadCount(), 6);

    options.threadCount = 0;
    QCOMPARE(options.resolvedThreadCount(), qMax(1, QThread::idealThreadCount()));

    options.threadCount = -3;
    QVERIFY(options.resolvedThreadCount() >= 1);
}

void TestOptions::testLoadSettings()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("chunkfetch.ini"));

    {
        QSettings writer(path, QSettings::IniFormat);
        writer.setValue(QStringLiteral("download/threads"), 12);
        writer.setValue(QStringLiteral("download/retries"), 5);
        writer.setValue(QStringLiteral("download/verbose"), false);
        writer.setValue(QStringLiteral("network/attempts"), 4);
        writer.setValue(QStringLiteral("network/retryDelayMs"), 250);
        writer.setValue(QStringLiteral("network/connectTimeout"), 7);
        writer.setValue(QStringLiteral("network/userAgent"), QStringLiteral("Tester/2"));
        writer.sync();
    }

    QSettings reader(path, QSettings::IniFormat);
    DownloadOptions options;
    options.loadSettings(reader);

    QCOMPARE(options.threadCount, 12);
    QCOMPARE(options.maxRetries, 5);
    QVERIFY(!options.verbose);
    QCOMPARE(options.fetch.attempts, 4);
    QCOMPARE(options.fetch.retryDelay.count(), Duration::rep(250));
    QCOMPARE(options.fetch.connectTimeoutSeconds, 7);
    QCOMPARE(options.fetch.userAgent, QString("Tester/2"));
}

void TestOptions::testMissingKeysKeepValues()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("partial.ini"));

    {
        QSettings writer(path, QSettings::IniFormat);
        writer.setValue(QStringLiteral("download/retries"), 9);
        writer.setValue(QStringLiteral("network/attempts"), 0);
        writer.sync();
    }

    QSettings reader(path, QSettings::IniFormat);
    DownloadOptions options;
    options.threadCount = 3;
    options.loadSettings(reader);

    QCOMPARE(options.threadCount, 3);
    QCOMPARE(options.maxRetries, 9);
    QVERIFY(options.verbose);
    // At least one attempt is always made
    QCOMPARE(options.fetch.attempts, 1);
}

void TestOptions::testErrorToString()
{
    DownloadError none;
    QVERIFY(!none.hasError());

    DownloadError bare = DownloadError::make(ErrorCategory::PlanInvalid,
                                             QStringLiteral("Invalid file size: 0"));
    QVERIFY(bare.hasError());
    QCOMPARE(bare.toString(), QString("Invalid file size: 0"));

    DownloadError detailed = DownloadError::make(ErrorCategory::ProbeFailed,
                                                 QStringLiteral("Failed to get content length"),
                                                 QStringLiteral("unexpected status code: 404"),
                                                 404);
    QCOMPARE(detailed.toString(),
             QString("Failed to get content length: unexpected status code: 404"));
    QCOMPARE(detailed.errorCode, 404L);
}

void TestOptions::testErrorWrapKeepsCause()
{
    DownloadError cause = DownloadError::make(ErrorCategory::ReadFailed,
                                              QStringLiteral("Failed to read response"),
                                              QStringLiteral("Connection reset by peer"), 56);
    cause.retryCount = 2;

    DownloadError wrapped = DownloadError::wrap(ErrorCategory::ChunkFetchFailed,
                                                QStringLiteral("Chunk 2 failed"), cause);

    QCOMPARE(wrapped.category, ErrorCategory::ChunkFetchFailed);
    QCOMPARE(wrapped.errorCode, 56L);
    QCOMPARE(wrapped.retryCount, 2);
    QCOMPARE(wrapped.toString(),
             QString("Chunk 2 failed: Failed to read response: Connection reset by peer"));
    QCOMPARE(errorCategoryToString(wrapped.category), QString("ChunkFetchFailed"));
}

QTEST_GUILESS_MAIN(TestOptions)
#include "test_options.moc"
