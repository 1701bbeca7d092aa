/**
 * @file CurlTransport.h
 * @brief libcurl implementation of HttpTransport
 */

#pragma once

#include "chunkfetch/engine/HttpTransport.h"
#include "chunkfetch/engine/DownloadOptions.h"

#include <atomic>

namespace ChunkFetch {

/**
 * @class CurlTransport
 * @brief HttpTransport backed by one libcurl easy handle per request
 *
 * Handles are never shared, so get() may run concurrently on any number
 * of threads. Redirects are followed.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const FetchPolicy& policy = FetchPolicy{});
    ~CurlTransport() override = default;

    HttpResult head(const QUrl& url) override;
    HttpResult get(const QUrl& url, const std::optional<ByteRange>& range,
                   const BodySink& sink) override;

    /// Lock-free store only; safe from a signal handler
    void abort() override { m_aborted.store(true); }
    bool isAborted() const override { return m_aborted.load(); }

private:
    FetchPolicy m_policy;
    std::atomic<bool> m_aborted{false};
};

} // namespace ChunkFetch
