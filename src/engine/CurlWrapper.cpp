/**
 * @file CurlWrapper.cpp
 * @brief Implementation of the RAII libcurl request
 *
 * @copyright Copyright (c) 2024 ChunkFetch Project
 * @license GPL-3.0-or-later
 */

#include "CurlWrapper.h"

#include "chunkfetch/engine/Types.h"

#include <QDebug>

namespace ChunkFetch {

namespace {

/// Owns the process-wide libcurl state
struct CurlGlobalState {
    CurlGlobalState()
        : code(curl_global_init(CURL_GLOBAL_ALL))
    {
        if (code != CURLE_OK) {
            qCritical() << "CurlRequest: curl_global_init failed:" << curl_easy_strerror(code);
        } else {
            qDebug() << "CurlRequest: Using" << curl_version();
        }
    }

    ~CurlGlobalState() {
        if (code == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    CURLcode code;
};

} // namespace

bool ensureCurlGlobalInit()
{
    static CurlGlobalState state;
    return state.code == CURLE_OK;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

CurlRequest::CurlRequest(const CurlRequestSetup& setup, const std::atomic<bool>* abortFlag)
    : m_abortFlag(abortFlag)
{
    if (!ensureCurlGlobalInit()) {
        return;
    }

    m_handle = curl_easy_init();
    if (!m_handle) {
        qCritical() << "CurlRequest: curl_easy_init returned null";
        return;
    }

    m_url = setup.url.toString(QUrl::FullyEncoded).toUtf8();
    m_userAgent = setup.userAgent.toUtf8();

    CURL* h = m_handle;
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, m_errorBuffer);
    curl_easy_setopt(h, CURLOPT_URL, m_url.constData());

    // Resolver timeouts must not raise SIGALRM on worker threads
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, setup.connectTimeoutSeconds);
    if (setup.lowSpeedLimitBytes > 0 && setup.lowSpeedTimeSeconds > 0) {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, setup.lowSpeedLimitBytes);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, setup.lowSpeedTimeSeconds);
    }
    if (!m_userAgent.isEmpty()) {
        curl_easy_setopt(h, CURLOPT_USERAGENT, m_userAgent.constData());
    }
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, setup.maxRedirects);

    if (setup.method == CurlRequestSetup::Method::Head) {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        if (setup.range) {
            m_range = QByteArray::number(setup.range->first) + '-'
                    + QByteArray::number(setup.range->second);
            curl_easy_setopt(h, CURLOPT_RANGE, m_range.constData());
        }
    }

    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &CurlRequest::onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &CurlRequest::onBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &CurlRequest::onProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
}

CurlRequest::~CurlRequest()
{
    if (m_handle) {
        curl_easy_cleanup(m_handle);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════════

CurlOutcome CurlRequest::perform()
{
    m_outcome = CurlOutcome{};

    if (!m_handle) {
        m_outcome.code = CURLE_FAILED_INIT;
        m_outcome.errorMessage = QString::fromUtf8(curl_easy_strerror(CURLE_FAILED_INIT));
        return m_outcome;
    }

    if (isAborted()) {
        m_outcome.code = CURLE_ABORTED_BY_CALLBACK;
        m_outcome.errorMessage = QStringLiteral("Aborted");
        return m_outcome;
    }

    m_errorBuffer[0] = '\0';
    CURLcode code = curl_easy_perform(m_handle);

    // The body callback stops with a write error when it sees the flag
    if (code != CURLE_OK && isAborted()) {
        code = CURLE_ABORTED_BY_CALLBACK;
    }

    m_outcome.code = code;
    m_outcome.httpCode = statusCode();

    if (code == CURLE_ABORTED_BY_CALLBACK) {
        m_outcome.errorMessage = QStringLiteral("Aborted");
    } else if (code != CURLE_OK) {
        m_outcome.errorMessage = QString::fromUtf8(m_errorBuffer[0] != '\0'
                                                       ? m_errorBuffer
                                                       : curl_easy_strerror(code));
    }

    return m_outcome;
}

long CurlRequest::statusCode() const
{
    long code = 0;
    curl_easy_getinfo(m_handle, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Callbacks
// ═══════════════════════════════════════════════════════════════════════════════

size_t CurlRequest::onBody(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* self = static_cast<CurlRequest*>(userdata);
    const size_t bytes = size * nmemb;

    if (self->isAborted()) {
        return 0;
    }

    if (!isAcceptableStatus(self->statusCode())) {
        return bytes;
    }

    if (self->m_receiver && !self->m_receiver(std::span<const char>(ptr, bytes))) {
        return 0;
    }

    self->m_outcome.bodyBytes += static_cast<qint64>(bytes);
    return bytes;
}

int CurlRequest::onProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    return static_cast<CurlRequest*>(clientp)->isAborted() ? 1 : 0;
}

size_t CurlRequest::onHeader(char* buffer, size_t size, size_t nitems, void* userdata)
{
    const size_t bytes = size * nitems;
    static_cast<CurlRequest*>(userdata)->readHeader(
        QByteArray(buffer, static_cast<qsizetype>(bytes)).trimmed());
    return bytes;
}

void CurlRequest::readHeader(const QByteArray& line)
{
    // A status line opens a new response: redirects and 1xx replies come first
    if (line.startsWith("HTTP/")) {
        m_outcome.contentLength = -1;
        m_outcome.acceptRanges.clear();
        return;
    }

    const qsizetype colon = line.indexOf(':');
    if (colon <= 0) {
        return;
    }

    const QByteArray name = line.left(colon).trimmed().toLower();
    const QByteArray value = line.mid(colon + 1).trimmed();

    if (name == "content-length") {
        bool ok = false;
        const qint64 length = value.toLongLong(&ok);
        if (ok) {
            m_outcome.contentLength = length;
        }
    } else if (name == "accept-ranges") {
        m_outcome.acceptRanges = QString::fromLatin1(value);
    }
}

} // namespace ChunkFetch
