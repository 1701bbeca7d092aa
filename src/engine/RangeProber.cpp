/**
 * @file RangeProber.cpp
 * @brief Implementation of RangeProber - server capability detection
 */

#include "chunkfetch/engine/RangeProber.h"
#include "chunkfetch/engine/ChunkFetcher.h"

#include <algorithm>
#include <QDebug>

namespace ChunkFetch {

namespace {

DownloadError cancelledError() {
    return DownloadError::make(ErrorCategory::Cancelled, QStringLiteral("Probe aborted"));
}

QString describeFailure(const HttpResult& response) {
    if (!response.transportOk) {
        return response.errorMessage;
    }
    return QStringLiteral("unexpected status code: %1").arg(response.httpCode);
}

} // namespace

RangeProber::RangeProber(HttpTransport& transport, const FetchPolicy& policy)
    : m_transport(transport)
    , m_policy(policy)
{
}

std::optional<ByteCount> RangeProber::contentLength(const QUrl& url, DownloadError* error) {
    const int attempts = std::max(1, m_policy.attempts);
    HttpResult response;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        response = m_transport.head(url);

        if (response.aborted || m_transport.isAborted()) {
            if (error) *error = cancelledError();
            return std::nullopt;
        }

        if (response.transportOk && response.httpCode == Constants::HTTP_OK) {
            qDebug() << "RangeProber: Content length of" << url.toString()
                     << "is" << response.contentLength;
            return response.contentLength;
        }

        qDebug() << "RangeProber: HEAD attempt" << attempt << "of" << attempts
                 << "failed:" << describeFailure(response);

        if (attempt < attempts && !waitUnlessAborted(m_transport, m_policy.retryDelay)) {
            if (error) *error = cancelledError();
            return std::nullopt;
        }
    }

    if (error) {
        *error = DownloadError::make(ErrorCategory::ProbeFailed,
                                     QStringLiteral("Failed to get content length"),
                                     describeFailure(response),
                                     response.transportOk ? response.httpCode
                                                          : response.transportCode);
    }
    return std::nullopt;
}

std::optional<bool> RangeProber::checkRangeSupport(const QUrl& url, DownloadError* error) {
    HttpResult response = m_transport.head(url);

    if (response.aborted || m_transport.isAborted()) {
        if (error) *error = cancelledError();
        return std::nullopt;
    }

    if (!response.transportOk || response.httpCode != Constants::HTTP_OK) {
        if (error) {
            *error = DownloadError::make(ErrorCategory::ProbeFailed,
                                         QStringLiteral("Failed to check range support"),
                                         describeFailure(response),
                                         response.transportOk ? response.httpCode
                                                              : response.transportCode);
        }
        return std::nullopt;
    }

    return response.advertisesByteRanges();
}

ProbeResult RangeProber::probe(const QUrl& url) {
    ProbeResult result;

    std::optional<ByteCount> length = contentLength(url, &result.error);
    if (!length) {
        return result;
    }
    result.contentLength = *length;

    std::optional<bool> ranges = checkRangeSupport(url, &result.error);
    if (!ranges) {
        return result;
    }
    result.supportsRanges = *ranges;

    qDebug() << "RangeProber: Completed. Size:" << result.contentLength
             << "Ranges:" << result.supportsRanges;

    return result;
}

} // namespace ChunkFetch
