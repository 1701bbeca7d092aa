/**
 * @file ChunkFetcher.h
 * @brief Fetch-with-retry primitive shared by ranged and whole-file GETs
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/HttpTransport.h"
#include "chunkfetch/engine/DownloadOptions.h"

#include <optional>

#include <QUrl>

namespace ChunkFetch {

/**
 * @brief Outcome of ChunkFetcher::fetch()
 */
struct FetchResult {
    DownloadError error;                ///< Empty on success
    ByteCount bytes = 0;                ///< Body bytes accepted by the sink
    long httpCode = 0;                  ///< Status of the last attempt
    int attempts = 0;                   ///< Requests issued

    [[nodiscard]] bool success() const noexcept { return !error.hasError(); }
};

/**
 * @brief Sleep for @p delay, waking early when @p transport is aborted
 * @return false if the transport was aborted
 */
bool waitUnlessAborted(const HttpTransport& transport, Duration delay);

/**
 * @class ChunkFetcher
 * @brief Issues one GET, retrying while nothing has been written yet
 *
 * A request is retried (fixed budget, fixed delay) when it fails at the
 * transport level or returns a status other than 200/206 before any body
 * byte reached the sink. Once bytes have been written a failure is final:
 * - sink refused data          → WriteFailed
 * - body broke off mid-stream  → ReadFailed
 * - budget exhausted           → TransferFailed
 * - transport aborted          → Cancelled
 */
class ChunkFetcher {
public:
    ChunkFetcher(HttpTransport& transport, const FetchPolicy& policy);

    /**
     * @brief Fetch @p url (or @p range of it) into @p sink
     */
    FetchResult fetch(const QUrl& url, const std::optional<ByteRange>& range,
                      const BodySink& sink);

private:
    HttpTransport& m_transport;
    FetchPolicy m_policy;
};

} // namespace ChunkFetch
