/**
 * @file DownloadTask.cpp
 * @brief Implementation of DownloadTask - download orchestration
 */

#include "chunkfetch/engine/DownloadTask.h"
#include "chunkfetch/engine/ChunkFetcher.h"
#include "chunkfetch/engine/ChunkPlanner.h"
#include "chunkfetch/engine/CurlTransport.h"
#include "chunkfetch/engine/FileMerger.h"
#include "chunkfetch/engine/ProgressMonitor.h"
#include "chunkfetch/engine/RangeProber.h"
#include "chunkfetch/engine/RetryCoordinator.h"
#include "chunkfetch/engine/WorkerPool.h"

#include <algorithm>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

DownloadTask::DownloadTask(const DownloadOptions& options, QObject* parent)
    : DownloadTask(options, std::make_unique<CurlTransport>(options.fetch), parent)
{
}

DownloadTask::DownloadTask(const DownloadOptions& options,
                           std::unique_ptr<HttpTransport> transport, QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_transport(std::move(transport))
{
    if (m_options.verbose) {
        m_console = std::make_unique<QTextStream>(stdout);
    }
}

DownloadTask::~DownloadTask() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Actions
// ═══════════════════════════════════════════════════════════════════════════════

DownloadError DownloadTask::run() {
    if (state() != DownloadState::Idle) {
        return DownloadError::make(ErrorCategory::InvalidArgument,
                                   QStringLiteral("Download already started"));
    }

    if (!m_options.url.isValid() || m_options.url.isEmpty()) {
        return fail(DownloadError::make(ErrorCategory::InvalidArgument,
                                        QStringLiteral("Invalid URL"),
                                        m_options.url.errorString()));
    }

    const int threads = m_options.resolvedThreadCount();
    const QString outputPath = m_options.resolvedOutputPath();

    status(QStringLiteral("Starting download of %1 with %2 threads")
               .arg(m_options.url.toString()).arg(threads));

    // Removed when this scope ends, whichever path returns
    QTemporaryDir scratch(QDir::tempPath() + QStringLiteral("/chunkfetch-XXXXXX"));
    if (!scratch.isValid()) {
        return fail(DownloadError::make(ErrorCategory::FileSystem,
                                        QStringLiteral("Failed to create temp directory"),
                                        scratch.errorString()));
    }
    m_scratchPath = scratch.path();

    setState(DownloadState::Probing);

    RangeProber prober(*m_transport, m_options.fetch);
    ProbeResult probe = prober.probe(m_options.url);
    if (!probe.success()) {
        return fail(probe.error);
    }

    m_contentLength = probe.contentLength;
    m_supportsRanges = probe.supportsRanges;

    DownloadError error;
    if (!m_supportsRanges || threads == 1) {
        error = runSingleThreaded(outputPath);
    } else {
        error = runMultiThreaded(outputPath, threads, scratch.path());
    }

    if (error.hasError()) {
        return fail(error);
    }

    if (isCancelled()) {
        return fail(DownloadError::make(ErrorCategory::Cancelled,
                                        QStringLiteral("Download canceled")));
    }

    m_lastError = {};
    setState(DownloadState::Done);
    status(QStringLiteral("Download completed: %1").arg(outputPath));

    return {};
}

void DownloadTask::cancel() {
    m_cancelled.store(true, std::memory_order_release);
    m_transport->abort();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Download Paths
// ═══════════════════════════════════════════════════════════════════════════════

DownloadError DownloadTask::runMultiThreaded(const QString& outputPath, int threads,
                                             const QString& scratchPath) {
    setState(DownloadState::MultiThreaded);
    status(QStringLiteral("Using multi-threaded download"));

    DownloadError error;
    std::unique_ptr<DownloadPlan> plan =
        ChunkPlanner::plan(m_contentLength, threads, scratchPath, &error);
    if (!plan) {
        return error;
    }

    const std::vector<Chunk*> chunks = plan->chunks();

    ProgressMonitor progress(m_contentLength, chunks);
    progress.setOutput(m_console.get());
    progress.start();

    WorkerPool pool(*m_transport, m_options.url, m_options.fetch);
    std::vector<ChunkResult> results =
        pool.run(static_cast<int>(chunks.size()), chunks, &error);
    if (error.hasError()) {
        progress.stop();
        return error;
    }

    bool hasFailures = false;
    for (const ChunkResult& result : results) {
        if (result.failed()) {
            hasFailures = true;
            qInfo().noquote() << "DownloadTask:" << result.error.toString();
        }
    }

    if (hasFailures && !isCancelled()) {
        status(QStringLiteral("Retrying failed chunks..."));

        RetryCoordinator coordinator(pool);
        DownloadError retryError = coordinator.retry(chunks, m_options.maxRetries);
        if (retryError.hasError()) {
            progress.stop();
            return DownloadError::wrap(retryError.category,
                                       QStringLiteral("Retry failed"), retryError);
        }
    }

    setState(DownloadState::Validating);
    if (!validateChunks(chunks)) {
        progress.stop();
        return DownloadError::make(ErrorCategory::IncompleteDownload,
                                   QStringLiteral("Download incomplete, some chunks failed"));
    }

    // Progress output and merging never overlap
    progress.stop();
    if (m_options.verbose) {
        progress.printSummary();
    }

    setState(DownloadState::Merging);
    status(QStringLiteral("Merging chunks..."));

    return FileMerger::merge(outputPath, plan->tempFilePaths());
}

DownloadError DownloadTask::runSingleThreaded(const QString& outputPath) {
    setState(DownloadState::SingleThreaded);

    if (!m_supportsRanges) {
        status(QStringLiteral("Server doesn't support range requests. "
                              "Using single-threaded download."));
    } else {
        status(QStringLiteral("Using single-threaded download."));
    }

    ProgressMonitor progress(m_contentLength);
    progress.setOutput(m_console.get());
    progress.start();

    // The output is only opened once a 200 body starts arriving, so a failed
    // request leaves an existing file untouched
    DownloadError openError;
    QFile outputFile;

    ChunkFetcher fetcher(*m_transport, m_options.fetch);
    FetchResult result = fetcher.fetch(m_options.url, std::nullopt,
        [&](std::span<const char> data) {
            if (!outputFile.isOpen()
                && !FileMerger::createOutputFile(outputFile, outputPath, &openError)) {
                return false;
            }

            const qint64 size = static_cast<qint64>(data.size());
            if (outputFile.write(data.data(), size) != size) {
                return false;
            }
            progress.addBytes(size);
            return true;
        });

    if (openError.hasError()) {
        progress.stop();
        return openError;
    }

    if (!result.success()) {
        outputFile.close();
        progress.stop();
        return result.error;
    }

    // Empty body: nothing reached the sink
    if (!outputFile.isOpen() && !FileMerger::createOutputFile(outputFile, outputPath, &openError)) {
        progress.stop();
        return openError;
    }

    const bool flushed = outputFile.flush();
    const QString fileError = outputFile.errorString();
    outputFile.close();
    progress.stop();

    if (!flushed) {
        return DownloadError::make(ErrorCategory::WriteFailed,
                                   QStringLiteral("Failed to write to file"), fileError);
    }

    if (m_options.verbose) {
        progress.printSummary();
    }

    return {};
}

// ═══════════════════════════════════════════════════════════════════════════════
// State Management
// ═══════════════════════════════════════════════════════════════════════════════

DownloadError DownloadTask::fail(const DownloadError& error) {
    // Whatever broke after cancel() is a consequence of it
    m_lastError = isCancelled()
        ? DownloadError::make(ErrorCategory::Cancelled, QStringLiteral("Download canceled"))
        : error;

    qDebug().noquote() << "DownloadTask: Failed in state" << downloadStateToString(state())
                       << "-" << m_lastError.toString();

    setState(DownloadState::Failed);
    return m_lastError;
}

void DownloadTask::setState(DownloadState newState) {
    DownloadState oldState = m_state.exchange(newState, std::memory_order_acq_rel);

    if (oldState != newState) {
        qDebug() << "DownloadTask: State changed from" << downloadStateToString(oldState)
                 << "to" << downloadStateToString(newState);
        emit stateChanged(newState);
    }
}

void DownloadTask::status(const QString& message) const {
    if (m_options.verbose) {
        qInfo().noquote() << message;
    }
}

} // namespace ChunkFetch
