/**
 * @file ChunkFetcher.cpp
 * @brief Implementation of ChunkFetcher - GET with fixed-delay retries
 */

#include "chunkfetch/engine/ChunkFetcher.h"

#include <algorithm>
#include <QDebug>
#include <QDeadlineTimer>
#include <QThread>

namespace ChunkFetch {

namespace {
constexpr int ABORT_POLL_INTERVAL_MS = 50;
}

ChunkFetcher::ChunkFetcher(HttpTransport& transport, const FetchPolicy& policy)
    : m_transport(transport)
    , m_policy(policy)
{
}

FetchResult ChunkFetcher::fetch(const QUrl& url, const std::optional<ByteRange>& range,
                                const BodySink& sink) {
    FetchResult result;
    const int attempts = std::max(1, m_policy.attempts);
    QString lastError;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (m_transport.isAborted()) {
            result.error = DownloadError::make(ErrorCategory::Cancelled,
                                               QStringLiteral("Transfer aborted"));
            return result;
        }

        bool sinkRefused = false;
        ByteCount delivered = 0;

        HttpResult response = m_transport.get(url, range,
            [&](std::span<const char> data) {
                if (!sink(data)) {
                    sinkRefused = true;
                    return false;
                }
                delivered += static_cast<ByteCount>(data.size());
                return true;
            });

        result.attempts = attempt;
        result.httpCode = response.httpCode;
        result.bytes = delivered;

        if (response.aborted || m_transport.isAborted()) {
            result.error = DownloadError::make(ErrorCategory::Cancelled,
                                               QStringLiteral("Transfer aborted"));
            return result;
        }

        if (sinkRefused) {
            result.error = DownloadError::make(ErrorCategory::WriteFailed,
                                               QStringLiteral("Failed to write to file"),
                                               QStringLiteral("after %1 bytes").arg(delivered));
            return result;
        }

        if (response.success()) {
            return result;
        }

        if (delivered > 0) {
            result.error = DownloadError::make(ErrorCategory::ReadFailed,
                                               QStringLiteral("Failed to read response"),
                                               response.errorMessage,
                                               response.transportCode);
            return result;
        }

        lastError = response.transportOk
            ? QStringLiteral("unexpected status code: %1").arg(response.httpCode)
            : response.errorMessage;

        qDebug() << "ChunkFetcher: Attempt" << attempt << "of" << attempts
                 << "for" << (range ? range->headerValue() : QStringLiteral("full body"))
                 << "failed:" << lastError;

        if (attempt < attempts && !waitUnlessAborted(m_transport, m_policy.retryDelay)) {
            result.error = DownloadError::make(ErrorCategory::Cancelled,
                                               QStringLiteral("Transfer aborted"));
            return result;
        }
    }

    result.error = DownloadError::make(ErrorCategory::TransferFailed,
                                       QStringLiteral("Failed to send request"),
                                       lastError, result.httpCode);
    return result;
}

bool waitUnlessAborted(const HttpTransport& transport, Duration delay) {
    QDeadlineTimer deadline(delay);

    while (!deadline.hasExpired()) {
        if (transport.isAborted()) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(
            std::min<qint64>(ABORT_POLL_INTERVAL_MS, deadline.remainingTime())));
    }

    return !transport.isAborted();
}

} // namespace ChunkFetch
