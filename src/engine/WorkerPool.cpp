/**
 * @file WorkerPool.cpp
 * @brief Implementation of WorkerPool, ChunkQueue and ResultSink
 */

#include "chunkfetch/engine/WorkerPool.h"
#include "chunkfetch/engine/ChunkWorker.h"

#include <memory>
#include <utility>

#include <QDebug>
#include <QMutexLocker>
#include <QThreadPool>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// ChunkQueue
// ═══════════════════════════════════════════════════════════════════════════════

ChunkQueue::ChunkQueue(const std::vector<Chunk*>& chunks)
    : m_pending(chunks.begin(), chunks.end())
{
}

Chunk* ChunkQueue::take() {
    QMutexLocker locker(&m_mutex);

    if (m_pending.empty()) {
        return nullptr;
    }

    Chunk* chunk = m_pending.front();
    m_pending.pop_front();
    return chunk;
}

size_t ChunkQueue::remaining() const {
    QMutexLocker locker(&m_mutex);
    return m_pending.size();
}

// ═══════════════════════════════════════════════════════════════════════════════
// ResultSink
// ═══════════════════════════════════════════════════════════════════════════════

void ResultSink::add(ChunkResult result) {
    QMutexLocker locker(&m_mutex);
    m_results.push_back(std::move(result));
}

size_t ResultSink::size() const {
    QMutexLocker locker(&m_mutex);
    return m_results.size();
}

std::vector<ChunkResult> ResultSink::takeAll() {
    QMutexLocker locker(&m_mutex);
    return std::exchange(m_results, {});
}

// ═══════════════════════════════════════════════════════════════════════════════
// WorkerPool
// ═══════════════════════════════════════════════════════════════════════════════

WorkerPool::WorkerPool(HttpTransport& transport, const QUrl& url, const FetchPolicy& policy)
    : m_transport(transport)
    , m_url(url)
    , m_policy(policy)
{
}

std::vector<ChunkResult> WorkerPool::run(int workerCount, const std::vector<Chunk*>& chunks,
                                         DownloadError* error) {
    if (workerCount <= 0) {
        if (error) {
            *error = DownloadError::make(ErrorCategory::InvalidArgument,
                                         QStringLiteral("Worker pool needs at least one worker"),
                                         QStringLiteral("requested %1").arg(workerCount));
        }
        return {};
    }

    if (chunks.empty()) {
        return {};
    }

    ChunkQueue queue(chunks);
    ResultSink results;

    QThreadPool threadPool;
    threadPool.setMaxThreadCount(workerCount);

    qDebug() << "WorkerPool: Starting" << workerCount << "workers for" << chunks.size() << "chunks";

    std::vector<std::unique_ptr<ChunkWorker>> workers;
    workers.reserve(static_cast<size_t>(workerCount));

    for (int i = 0; i < workerCount; ++i) {
        auto worker = std::make_unique<ChunkWorker>(i, m_transport, m_url, m_policy,
                                                    queue, results);
        threadPool.start(worker.get());
        workers.push_back(std::move(worker));
    }

    // Every worker loops until the queue is empty
    threadPool.waitForDone();

    if (results.size() != chunks.size()) {
        qCritical() << "WorkerPool: Expected" << chunks.size() << "results, got" << results.size();
    }

    qDebug() << "WorkerPool: All workers finished," << results.size() << "results";

    return results.takeAll();
}

} // namespace ChunkFetch
