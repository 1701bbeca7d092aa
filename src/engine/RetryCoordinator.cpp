/**
 * @file RetryCoordinator.cpp
 * @brief Implementation of RetryCoordinator
 */

#include "chunkfetch/engine/RetryCoordinator.h"

#include <QDebug>

namespace ChunkFetch {

RetryCoordinator::RetryCoordinator(WorkerPool& pool)
    : m_pool(pool)
{
}

std::vector<Chunk*> RetryCoordinator::selectRetryable(const std::vector<Chunk*>& chunks,
                                                      int maxRetries) {
    std::vector<Chunk*> selected;

    for (Chunk* chunk : chunks) {
        auto state = chunk->snapshot();
        if (state.failed && state.retryCount < maxRetries) {
            selected.push_back(chunk);
        }
    }

    return selected;
}

DownloadError RetryCoordinator::retry(const std::vector<Chunk*>& chunks, int maxRetries) {
    std::vector<Chunk*> selected = selectRetryable(chunks, maxRetries);

    if (selected.empty()) {
        qDebug() << "RetryCoordinator: Nothing to retry";
        return {};
    }

    for (Chunk* chunk : selected) {
        qDebug() << "RetryCoordinator: Retrying chunk" << chunk->index()
                 << "after" << chunk->retryCount() << "failed attempts";
        chunk->resetForRetry();
    }

    DownloadError poolError;
    std::vector<ChunkResult> results =
        m_pool.run(static_cast<int>(selected.size()), selected, &poolError);

    if (poolError.hasError()) {
        return poolError;
    }

    for (const ChunkResult& result : results) {
        if (result.failed()) {
            return result.error;
        }
    }

    qDebug() << "RetryCoordinator:" << selected.size() << "chunks recovered";
    return {};
}

} // namespace ChunkFetch
