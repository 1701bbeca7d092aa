/**
 * @file CurlWrapper.h
 * @brief RAII wrapper for libcurl easy handles
 *
 * One CurlRequest drives exactly one HTTP exchange:
 * - libcurl global state is set up once per process
 * - the request is described by a CurlRequestSetup and applied in one go
 * - headers of the final response (after redirects) are collected
 * - a shared abort flag is polled from the transfer callbacks
 *
 * @copyright Copyright (c) 2024 ChunkFetch Project
 * @license GPL-3.0-or-later
 */

#ifndef CHUNKFETCH_CURLWRAPPER_H
#define CHUNKFETCH_CURLWRAPPER_H

#include <curl/curl.h>
#include <QString>
#include <QUrl>
#include <QByteArray>

#include <atomic>
#include <functional>
#include <optional>
#include <span>
#include <utility>

namespace ChunkFetch {

/**
 * @brief Initialize libcurl for the whole process
 * @return False if curl_global_init() failed
 *
 * Thread-safe; the first call does the work.
 */
bool ensureCurlGlobalInit();

/**
 * @brief Everything needed to issue one request
 */
struct CurlRequestSetup {
    enum class Method { Head, Get };

    Method method = Method::Get;
    QUrl url;
    std::optional<std::pair<qint64, qint64>> range;     ///< Inclusive byte range
    long connectTimeoutSeconds = 30;
    long lowSpeedLimitBytes = 0;                        ///< 0 disables the check
    long lowSpeedTimeSeconds = 0;
    long maxRedirects = 10;
    QString userAgent;
};

/**
 * @brief Outcome of CurlRequest::perform()
 */
struct CurlOutcome {
    CURLcode code = CURLE_OK;
    long httpCode = 0;
    QString errorMessage;
    qint64 bodyBytes = 0;               ///< Bytes accepted by the body receiver
    qint64 contentLength = -1;          ///< Content-Length of the final response
    QString acceptRanges;               ///< Accept-Ranges of the final response

    [[nodiscard]] bool completed() const noexcept { return code == CURLE_OK; }

    [[nodiscard]] bool aborted() const noexcept {
        return code == CURLE_ABORTED_BY_CALLBACK;
    }
};

/**
 * @class CurlRequest
 * @brief A single libcurl easy handle bound to one request
 *
 * The body receiver only sees bytes of 200/206 responses; other bodies are
 * read and dropped so error pages never reach a chunk file. When the abort
 * flag is raised the transfer stops within one callback round.
 */
class CurlRequest {
public:
    using BodyReceiver = std::function<bool(std::span<const char> data)>;

    CurlRequest(const CurlRequestSetup& setup, const std::atomic<bool>* abortFlag);
    ~CurlRequest();

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void setBodyReceiver(BodyReceiver receiver) { m_receiver = std::move(receiver); }

    /**
     * @brief Run the request to completion (blocking)
     */
    [[nodiscard]] CurlOutcome perform();

private:
    bool isAborted() const noexcept { return m_abortFlag && m_abortFlag->load(); }
    long statusCode() const;

    static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata);
    static int onProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    void readHeader(const QByteArray& line);

    CURL* m_handle = nullptr;
    char m_errorBuffer[CURL_ERROR_SIZE] = {0};

    // libcurl keeps pointers to these for the lifetime of the handle
    QByteArray m_url;
    QByteArray m_range;
    QByteArray m_userAgent;

    BodyReceiver m_receiver;
    const std::atomic<bool>* m_abortFlag;
    CurlOutcome m_outcome;
};

} // namespace ChunkFetch

#endif // CHUNKFETCH_CURLWRAPPER_H
