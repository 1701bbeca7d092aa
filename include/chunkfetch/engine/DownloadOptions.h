/**
 * @file DownloadOptions.h
 * @brief Configuration bundle for one download
 */

#pragma once

#include "chunkfetch/engine/Types.h"

#include <QString>
#include <QUrl>

class QSettings;

namespace ChunkFetch {

/**
 * @brief Retry and network tuning shared by every request of a download
 */
struct FetchPolicy {
    int attempts = Constants::FETCH_ATTEMPTS;               ///< Tries per request
    Duration retryDelay = Constants::FETCH_RETRY_DELAY;     ///< Fixed pause between tries
    int connectTimeoutSeconds = Constants::CONNECT_TIMEOUT_SECONDS;
    int lowSpeedLimitBytes = Constants::LOW_SPEED_LIMIT_BYTES;
    int lowSpeedTimeSeconds = Constants::LOW_SPEED_TIME_SECONDS;
    QString userAgent = QStringLiteral("ChunkFetch/1.0 (compatible; libcurl)");
};

/**
 * @brief Everything the engine needs from its caller
 */
struct DownloadOptions {
    QUrl url;
    QString outputPath;                 ///< Empty: derived from the URL
    int threadCount = 0;                ///< <= 0: QThread::idealThreadCount()
    int maxRetries = Constants::DEFAULT_MAX_RETRIES;
    bool verbose = true;
    FetchPolicy fetch;

    /**
     * @brief Defaults with the thread count resolved
     */
    static DownloadOptions defaults();

    /**
     * @brief Overlay values found in @p settings
     *
     * Keys: download/threads, download/retries, download/verbose,
     * network/attempts, network/retryDelayMs, network/connectTimeout,
     * network/userAgent. Missing keys keep their current value.
     */
    void loadSettings(const QSettings& settings);

    /// @return outputPath, or the URL's last path segment ("download" if none)
    QString resolvedOutputPath() const;

    /// @return threadCount, or the ideal thread count when threadCount <= 0
    int resolvedThreadCount() const;
};

} // namespace ChunkFetch
