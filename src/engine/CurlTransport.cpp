/**
 * @file CurlTransport.cpp
 * @brief Implementation of CurlTransport
 */

#include "chunkfetch/engine/CurlTransport.h"
#include "CurlWrapper.h"

#include <QDebug>

namespace ChunkFetch {

namespace {

CurlRequestSetup makeSetup(CurlRequestSetup::Method method, const QUrl& url,
                           const FetchPolicy& policy)
{
    CurlRequestSetup setup;
    setup.method = method;
    setup.url = url;
    setup.connectTimeoutSeconds = policy.connectTimeoutSeconds;
    setup.lowSpeedLimitBytes = policy.lowSpeedLimitBytes;
    setup.lowSpeedTimeSeconds = policy.lowSpeedTimeSeconds;
    setup.maxRedirects = Constants::MAX_REDIRECTS;
    setup.userAgent = policy.userAgent;
    return setup;
}

HttpResult toHttpResult(const CurlOutcome& outcome)
{
    HttpResult result;
    result.transportOk = outcome.completed();
    result.httpCode = outcome.httpCode;
    result.transportCode = static_cast<int>(outcome.code);
    result.errorMessage = outcome.errorMessage;
    result.contentLength = outcome.contentLength;
    result.acceptRanges = outcome.acceptRanges;
    result.bodyBytes = outcome.bodyBytes;
    result.aborted = outcome.aborted();
    return result;
}

} // namespace

CurlTransport::CurlTransport(const FetchPolicy& policy)
    : m_policy(policy)
{
}

HttpResult CurlTransport::head(const QUrl& url)
{
    CurlRequest request(makeSetup(CurlRequestSetup::Method::Head, url, m_policy), &m_aborted);

    CurlOutcome outcome = request.perform();
    if (!outcome.completed()) {
        qDebug() << "CurlTransport: HEAD" << url.toString() << "failed:" << outcome.errorMessage;
    }

    return toHttpResult(outcome);
}

HttpResult CurlTransport::get(const QUrl& url, const std::optional<ByteRange>& range,
                              const BodySink& sink)
{
    CurlRequestSetup setup = makeSetup(CurlRequestSetup::Method::Get, url, m_policy);
    if (range) {
        setup.range = std::make_pair(range->start, range->end);
    }

    CurlRequest request(setup, &m_aborted);
    request.setBodyReceiver(sink);

    CurlOutcome outcome = request.perform();
    if (!outcome.completed()) {
        qDebug() << "CurlTransport: GET" << url.toString()
                 << (range ? range->headerValue() : QString())
                 << "failed:" << outcome.errorMessage;
    }

    return toHttpResult(outcome);
}

} // namespace ChunkFetch
