/**
 * @file WorkerPool.h
 * @brief Fixed-size pool of chunk workers draining a shared queue
 *
 * The pool is built per run() call: the queue is filled with every chunk up
 * front, workerCount ChunkWorkers drain it on a private QThreadPool, and each
 * processed chunk leaves exactly one ChunkResult in the result sink.
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/Chunk.h"
#include "chunkfetch/engine/DownloadOptions.h"
#include "chunkfetch/engine/HttpTransport.h"

#include <deque>
#include <vector>

#include <QMutex>
#include <QUrl>

namespace ChunkFetch {

/**
 * @brief Result of one fetch attempt for one chunk
 */
struct ChunkResult {
    Chunk* chunk = nullptr;
    DownloadError error;                ///< Empty when the chunk completed

    bool failed() const { return error.hasError(); }
};

/**
 * @class ChunkQueue
 * @brief Bounded FIFO of chunks, filled once and drained by workers
 */
class ChunkQueue {
public:
    explicit ChunkQueue(const std::vector<Chunk*>& chunks);

    /**
     * @brief Pop the next chunk
     * @return Chunk, or nullptr once drained
     */
    Chunk* take();

    size_t remaining() const;

private:
    mutable QMutex m_mutex;
    std::deque<Chunk*> m_pending;
};

/**
 * @class ResultSink
 * @brief Thread-safe collector for ChunkResults
 */
class ResultSink {
public:
    void add(ChunkResult result);

    size_t size() const;

    /// @return Collected results, leaving the sink empty
    std::vector<ChunkResult> takeAll();

private:
    mutable QMutex m_mutex;
    std::vector<ChunkResult> m_results;
};

/**
 * @class WorkerPool
 * @brief Runs ranged fetches for a set of chunks concurrently
 */
class WorkerPool {
public:
    /**
     * @param transport HTTP transport shared by all workers
     * @param url Resource URL
     * @param policy Fetch retry/timeout policy
     */
    WorkerPool(HttpTransport& transport, const QUrl& url, const FetchPolicy& policy);

    /**
     * @brief Download every chunk once
     *
     * Blocks until each chunk has produced exactly one result. Chunk failures
     * are reported in the results, not as a pool error.
     *
     * @param workerCount Number of concurrent workers
     * @param chunks Chunks to process
     * @param error Set when the pool cannot start (workerCount <= 0)
     * @return One result per chunk, in completion order
     */
    std::vector<ChunkResult> run(int workerCount, const std::vector<Chunk*>& chunks,
                                 DownloadError* error = nullptr);

private:
    HttpTransport& m_transport;
    QUrl m_url;
    FetchPolicy m_policy;
};

} // namespace ChunkFetch
