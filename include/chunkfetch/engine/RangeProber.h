/**
 * @file RangeProber.h
 * @brief Content length and range support detection via HTTP HEAD
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/HttpTransport.h"
#include "chunkfetch/engine/DownloadOptions.h"

#include <optional>

#include <QUrl>

namespace ChunkFetch {

/**
 * @brief Server capabilities needed to pick a download strategy
 */
struct ProbeResult {
    DownloadError error;
    ByteCount contentLength = -1;
    bool supportsRanges = false;

    [[nodiscard]] bool success() const noexcept { return !error.hasError(); }
};

/**
 * @class RangeProber
 * @brief Probes a server before any body is transferred
 *
 * Two independent HEAD-based checks:
 * - contentLength(): retried on transport errors and non-200 statuses
 * - checkRangeSupport(): single request, Accept-Ranges must be "bytes"
 *
 * Both report failures as ProbeFailed.
 */
class RangeProber {
public:
    RangeProber(HttpTransport& transport, const FetchPolicy& policy);

    /**
     * @brief Advertised Content-Length of @p url
     * @param error Receives ProbeFailed (or Cancelled) when nullopt is returned
     */
    std::optional<ByteCount> contentLength(const QUrl& url, DownloadError* error = nullptr);

    /**
     * @brief Whether @p url advertises "Accept-Ranges: bytes"
     * @param error Receives ProbeFailed when nullopt is returned
     */
    std::optional<bool> checkRangeSupport(const QUrl& url, DownloadError* error = nullptr);

    /**
     * @brief Run both checks, content length first
     */
    ProbeResult probe(const QUrl& url);

private:
    HttpTransport& m_transport;
    FetchPolicy m_policy;
};

} // namespace ChunkFetch
