/**
 * @file HttpTransport.h
 * @brief Abstract HTTP transport used by the prober and the fetchers
 */

#pragma once

#include "chunkfetch/engine/Types.h"

#include <functional>
#include <optional>
#include <span>

#include <QString>
#include <QUrl>

namespace ChunkFetch {

/**
 * @brief Inclusive byte range for a Range request
 */
struct ByteRange {
    ByteOffset start = 0;
    ByteOffset end = 0;

    ByteCount size() const { return end - start + 1; }

    /// @return "bytes=<start>-<end>"
    QString headerValue() const {
        return QStringLiteral("bytes=%1-%2").arg(start).arg(end);
    }
};

/**
 * @brief Outcome of one HTTP request
 *
 * transportOk is false when no complete response was received (connect
 * failure, timeout, abort, sink refusal). httpCode is 0 when no status line
 * arrived at all.
 */
struct HttpResult {
    bool transportOk = false;
    long httpCode = 0;
    int transportCode = 0;              ///< libcurl code or implementation-specific
    QString errorMessage;
    ByteCount contentLength = -1;       ///< Content-Length header (-1 if absent)
    QString acceptRanges;               ///< Accept-Ranges header value
    ByteCount bodyBytes = 0;            ///< Bytes handed to the sink
    bool aborted = false;               ///< Stopped by abort()

    [[nodiscard]] bool success() const noexcept {
        return transportOk && isAcceptableStatus(httpCode);
    }

    [[nodiscard]] bool advertisesByteRanges() const {
        return acceptRanges.trimmed().compare(QLatin1String("bytes"), Qt::CaseInsensitive) == 0;
    }
};

/**
 * @brief Receives response body bytes
 * @return true to continue, false to abort the transfer
 */
using BodySink = std::function<bool(std::span<const char> data)>;

/**
 * @class HttpTransport
 * @brief Minimal HTTP client seam
 *
 * Implementations must allow concurrent get() calls from several worker
 * threads. The body of a response is only delivered to the sink when its
 * status is 200 or 206; other bodies are drained and dropped.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Metadata-only request (HEAD)
     */
    virtual HttpResult head(const QUrl& url) = 0;

    /**
     * @brief GET, optionally restricted to a byte range
     * @param url Resource URL
     * @param range Range to request, or nullopt for the whole resource
     * @param sink Receiver for body bytes
     */
    virtual HttpResult get(const QUrl& url, const std::optional<ByteRange>& range,
                           const BodySink& sink) = 0;

    /**
     * @brief Abort every outstanding and future transfer
     *
     * Must be async-signal-safe: it is called from the SIGINT handler.
     */
    virtual void abort() = 0;

    /// @return True once abort() has been called
    virtual bool isAborted() const = 0;
};

} // namespace ChunkFetch
