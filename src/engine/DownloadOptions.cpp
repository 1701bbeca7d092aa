/**
 * @file DownloadOptions.cpp
 * @brief Defaults and QSettings overlay for DownloadOptions
 */

#include "chunkfetch/engine/DownloadOptions.h"

#include <algorithm>
#include <QDebug>
#include <QSettings>
#include <QThread>

namespace ChunkFetch {

DownloadOptions DownloadOptions::defaults() {
    DownloadOptions options;
    options.threadCount = options.resolvedThreadCount();
    return options;
}

void DownloadOptions::loadSettings(const QSettings& settings) {
    threadCount = settings.value(QStringLiteral("download/threads"), threadCount).toInt();
    maxRetries = settings.value(QStringLiteral("download/retries"), maxRetries).toInt();
    verbose = settings.value(QStringLiteral("download/verbose"), verbose).toBool();

    fetch.attempts = std::max(1, settings.value(QStringLiteral("network/attempts"),
                                                fetch.attempts).toInt());
    fetch.retryDelay = Duration{settings.value(QStringLiteral("network/retryDelayMs"),
                                               static_cast<qlonglong>(fetch.retryDelay.count()))
                                    .toLongLong()};
    fetch.connectTimeoutSeconds = settings.value(QStringLiteral("network/connectTimeout"),
                                                 fetch.connectTimeoutSeconds).toInt();
    fetch.userAgent = settings.value(QStringLiteral("network/userAgent"),
                                     fetch.userAgent).toString();

    qDebug() << "DownloadOptions: Loaded settings from" << settings.fileName();
}

QString DownloadOptions::resolvedOutputPath() const {
    if (!outputPath.isEmpty()) {
        return outputPath;
    }

    QString fileName = url.fileName();
    if (fileName.isEmpty()) {
        fileName = QStringLiteral("download");
    }
    return fileName;
}

int DownloadOptions::resolvedThreadCount() const {
    if (threadCount > 0) {
        return threadCount;
    }
    return std::max(1, QThread::idealThreadCount());
}

} // namespace ChunkFetch
