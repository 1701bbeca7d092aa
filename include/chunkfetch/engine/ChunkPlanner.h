/**
 * @file ChunkPlanner.h
 * @brief Partitioning of a content length into contiguous byte-range chunks
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/Chunk.h"

#include <memory>
#include <vector>

#include <QStringList>

namespace ChunkFetch {

/**
 * @class DownloadPlan
 * @brief Ordered chunks that exactly cover one resource
 *
 * The plan owns its chunks; everything else works with raw Chunk pointers
 * that stay valid for the plan's lifetime.
 */
class DownloadPlan {
public:
    DownloadPlan(ByteCount contentLength, std::vector<std::unique_ptr<Chunk>> chunks);

    DownloadPlan(const DownloadPlan&) = delete;
    DownloadPlan& operator=(const DownloadPlan&) = delete;

    /// @return Number of chunks
    size_t size() const { return m_chunks.size(); }

    /// @return Total resource size covered by the plan
    ByteCount contentLength() const { return m_contentLength; }

    /// @return Chunk at @p index (0-based)
    Chunk* chunk(size_t index) const { return m_chunks.at(index).get(); }

    /// @return All chunks, in index order
    std::vector<Chunk*> chunks() const;

    /// @return Temp file paths, in index order
    QStringList tempFilePaths() const;

private:
    ByteCount m_contentLength;
    std::vector<std::unique_ptr<Chunk>> m_chunks;
};

/**
 * @class ChunkPlanner
 * @brief Splits a resource into one chunk per requested thread
 */
class ChunkPlanner {
public:
    /**
     * @brief Build a plan for @p contentLength bytes
     *
     * - requestedThreads <= 0 is treated as 1
     * - more threads than bytes is clamped to one byte per chunk
     * - every chunk gets contentLength / threads bytes; the last one also
     *   takes the remainder so it ends at contentLength - 1
     *
     * @param contentLength Resource size in bytes
     * @param requestedThreads Desired chunk count
     * @param tempDir Directory for the chunk temp files
     * @param error Set to PlanInvalid when contentLength <= 0
     * @return The plan, or nullptr on error
     */
    static std::unique_ptr<DownloadPlan> plan(ByteCount contentLength,
                                              int requestedThreads,
                                              const QString& tempDir,
                                              DownloadError* error = nullptr);

    /**
     * @brief Chunk count plan() would produce
     */
    static int effectiveChunkCount(ByteCount contentLength, int requestedThreads);
};

/**
 * @brief Check that every chunk finished and none is flagged failed
 */
bool validateChunks(const std::vector<Chunk*>& chunks);

} // namespace ChunkFetch
