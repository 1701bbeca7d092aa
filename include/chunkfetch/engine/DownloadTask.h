/**
 * @file DownloadTask.h
 * @brief Top-level engine: one blocking download of one URL
 *
 * DownloadTask coordinates the complete lifecycle of downloading a file:
 * - Server probing (content length, range support)
 * - Chunk planning and the worker pool
 * - One retry pass for failed chunks
 * - Progress reporting
 * - Merging chunk files into the output
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/DownloadOptions.h"
#include "chunkfetch/engine/HttpTransport.h"

#include <atomic>
#include <memory>

#include <QObject>
#include <QString>

class QTextStream;

namespace ChunkFetch {

/**
 * @class DownloadTask
 * @brief Runs a chunked (or single-stream) download to completion
 *
 * Responsibilities:
 * 1. Probe the server for size and range support
 * 2. Route to the multi-threaded or single-threaded path
 * 3. Validate chunks, then merge them in index order
 * 4. Remove the scratch directory on every exit path
 *
 * Thread Safety:
 * - run() blocks the calling thread
 * - cancel() may be called from any thread, including a signal handler
 */
class DownloadTask : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Create a task using the libcurl transport
     */
    explicit DownloadTask(const DownloadOptions& options, QObject* parent = nullptr);

    /**
     * @brief Create a task with an explicit transport
     */
    DownloadTask(const DownloadOptions& options, std::unique_ptr<HttpTransport> transport,
                 QObject* parent = nullptr);

    ~DownloadTask() override;

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Actions
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Download the resource; blocks until done
     * @return Empty error on success, otherwise the failure that ended the run
     */
    DownloadError run();

    /**
     * @brief Abort outstanding transfers; run() then returns Cancelled
     *
     * Only atomic stores, so it may be called from a signal handler.
     */
    void cancel();

    // ───────────────────────────────────────────────────────────────────────
    // State
    // ───────────────────────────────────────────────────────────────────────

    DownloadState state() const { return m_state.load(std::memory_order_acquire); }

    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    /// @return Last error (empty after a successful run)
    DownloadError lastError() const { return m_lastError; }

    /// @return Probed content length (-1 before probing)
    ByteCount contentLength() const { return m_contentLength; }

    /// @return True if the probe found "Accept-Ranges: bytes"
    bool supportsRanges() const { return m_supportsRanges; }

    /// @return Scratch directory used by the last run (removed by now)
    QString scratchPath() const { return m_scratchPath; }

    const DownloadOptions& options() const { return m_options; }

signals:
    /**
     * @brief Emitted on every state transition
     *
     * Emitted from the thread that called run().
     */
    void stateChanged(ChunkFetch::DownloadState state);

private:
    DownloadError runMultiThreaded(const QString& outputPath, int threads,
                                   const QString& scratchPath);
    DownloadError runSingleThreaded(const QString& outputPath);

    DownloadError fail(const DownloadError& error);
    void setState(DownloadState newState);
    void status(const QString& message) const;

    DownloadOptions m_options;
    std::unique_ptr<HttpTransport> m_transport;
    std::unique_ptr<QTextStream> m_console;     ///< Progress output, verbose only

    std::atomic<DownloadState> m_state{DownloadState::Idle};
    std::atomic<bool> m_cancelled{false};

    ByteCount m_contentLength = -1;
    bool m_supportsRanges = false;
    QString m_scratchPath;
    DownloadError m_lastError;
};

} // namespace ChunkFetch
