/**
 * @file RetryCoordinator.h
 * @brief Single retry pass over failed chunks
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/Chunk.h"
#include "chunkfetch/engine/WorkerPool.h"

#include <vector>

namespace ChunkFetch {

/**
 * @class RetryCoordinator
 * @brief Re-runs failed chunks that still have retry budget
 *
 * A chunk qualifies when it is failed and its retryCount is below
 * maxRetries. Qualifying chunks are reset (temp file removed) and handed to
 * the worker pool with one worker each. Chunks that already exhausted their
 * budget are skipped silently; the final validation reports them.
 */
class RetryCoordinator {
public:
    explicit RetryCoordinator(WorkerPool& pool);

    /**
     * @brief Chunks eligible for a retry
     */
    static std::vector<Chunk*> selectRetryable(const std::vector<Chunk*>& chunks, int maxRetries);

    /**
     * @brief Run one retry pass
     * @return First chunk error among the retry results, or no error
     */
    DownloadError retry(const std::vector<Chunk*>& chunks, int maxRetries);

private:
    WorkerPool& m_pool;
};

} // namespace ChunkFetch
