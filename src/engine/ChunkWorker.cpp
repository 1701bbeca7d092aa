/**
 * @file ChunkWorker.cpp
 * @brief Implementation of ChunkWorker - ranged GET into a chunk temp file
 */

#include "chunkfetch/engine/ChunkWorker.h"

#include <QDebug>
#include <QFile>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

ChunkWorker::ChunkWorker(int id, HttpTransport& transport, const QUrl& url,
                         const FetchPolicy& policy, ChunkQueue& queue, ResultSink& results)
    : m_id(id)
    , m_fetcher(transport, policy)
    , m_url(url)
    , m_queue(queue)
    , m_results(results)
{
    setAutoDelete(false);  // WorkerPool owns the workers
}

// ═══════════════════════════════════════════════════════════════════════════════
// Main Worker Loop
// ═══════════════════════════════════════════════════════════════════════════════

void ChunkWorker::run() {
    qDebug() << "ChunkWorker" << m_id << ": Starting";

    int processed = 0;
    while (Chunk* chunk = m_queue.take()) {
        m_results.add(downloadChunk(chunk));
        ++processed;
    }

    qDebug() << "ChunkWorker" << m_id << ": Queue drained after" << processed << "chunks";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Download Implementation
// ═══════════════════════════════════════════════════════════════════════════════

ChunkResult ChunkWorker::downloadChunk(Chunk* chunk) {
    ChunkResult result;
    result.chunk = chunk;

    DownloadError cause;
    QFile file(chunk->tempFilePath());

    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        cause = DownloadError::make(ErrorCategory::WriteFailed,
                                    QStringLiteral("Failed to create temp file %1")
                                        .arg(chunk->tempFilePath()),
                                    file.errorString());
    } else {
        qDebug() << "ChunkWorker" << m_id << ": Downloading chunk" << chunk->index()
                 << "Range:" << chunk->rangeHeader();

        ByteCount written = 0;
        bool overflow = false;

        const ByteRange range{chunk->startByte(), chunk->endByte()};
        FetchResult fetched = m_fetcher.fetch(m_url, range,
            [&](std::span<const char> data) {
                const auto size = static_cast<qint64>(data.size());
                if (written + size > chunk->size()) {
                    overflow = true;
                    return false;
                }

                qint64 n = file.write(data.data(), size);
                if (n != size) {
                    qDebug() << "ChunkWorker" << m_id << ": Write failed, expected:" << size
                             << "written:" << n << file.errorString();
                    return false;
                }

                written += n;
                chunk->updateProgress(n);
                return true;
            });

        const bool flushed = file.flush();
        file.close();

        if (overflow) {
            cause = DownloadError::make(ErrorCategory::ReadFailed,
                                        QStringLiteral("Server sent more than the requested range"),
                                        QStringLiteral("status %1, range %2")
                                            .arg(fetched.httpCode)
                                            .arg(chunk->rangeHeader()));
        } else if (!fetched.success()) {
            cause = fetched.error;
        } else if (!flushed) {
            cause = DownloadError::make(ErrorCategory::WriteFailed,
                                        QStringLiteral("Failed to flush temp file"),
                                        file.errorString());
        } else if (written != chunk->size()) {
            cause = DownloadError::make(ErrorCategory::ReadFailed,
                                        QStringLiteral("Incomplete chunk"),
                                        QStringLiteral("expected %1 bytes, got %2")
                                            .arg(chunk->size())
                                            .arg(written));
        }
    }

    if (cause.hasError()) {
        chunk->markFailed(cause.toString());
        result.error = DownloadError::wrap(ErrorCategory::ChunkFetchFailed,
                                           QStringLiteral("Chunk %1 failed").arg(chunk->index()),
                                           cause);
        result.error.retryCount = chunk->retryCount();

        qDebug() << "ChunkWorker" << m_id << ":" << result.error.toString();
        return result;
    }

    qDebug() << "ChunkWorker" << m_id << ": Chunk" << chunk->index() << "completed successfully";
    return result;
}

} // namespace ChunkFetch
