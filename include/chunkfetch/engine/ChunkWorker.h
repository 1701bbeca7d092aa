/**
 * @file ChunkWorker.h
 * @brief Worker runnable that downloads chunks into their temp files
 *
 * ChunkWorker performs the HTTP transfer for one chunk at a time. It pulls
 * chunks from the pool's queue until it is drained, writes each response body
 * to the chunk's temp file and reports one ChunkResult per chunk.
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/Chunk.h"
#include "chunkfetch/engine/ChunkFetcher.h"
#include "chunkfetch/engine/WorkerPool.h"

#include <QRunnable>
#include <QUrl>

namespace ChunkFetch {

/**
 * @class ChunkWorker
 * @brief Downloads chunks using HTTP byte-range requests
 *
 * Lifecycle:
 * 1. Worker is created by WorkerPool and started on its QThreadPool
 * 2. Worker takes a chunk from the queue
 * 3. Worker truncates the chunk's temp file and streams the range into it
 * 4. On failure the chunk is marked failed; either way a result is emitted
 * 5. Worker takes the next chunk, and exits once the queue is empty
 *
 * Memory Safety:
 * - Worker does not own chunks (the DownloadPlan does)
 * - Queue and sink outlive the worker (owned by WorkerPool::run)
 */
class ChunkWorker : public QRunnable {
public:
    /**
     * @param id Worker number, for logging
     * @param transport HTTP transport
     * @param url Resource URL
     * @param policy Fetch policy
     * @param queue Source of chunks
     * @param results Destination of results
     */
    ChunkWorker(int id, HttpTransport& transport, const QUrl& url, const FetchPolicy& policy,
                ChunkQueue& queue, ResultSink& results);

    ChunkWorker(const ChunkWorker&) = delete;
    ChunkWorker& operator=(const ChunkWorker&) = delete;

    /**
     * @brief Main worker loop - called by QThreadPool
     */
    void run() override;

    /**
     * @brief Download a single chunk
     * @return Result carrying a ChunkFetchFailed error on failure
     */
    ChunkResult downloadChunk(Chunk* chunk);

private:
    int m_id;
    ChunkFetcher m_fetcher;
    QUrl m_url;
    ChunkQueue& m_queue;
    ResultSink& m_results;
};

} // namespace ChunkFetch
