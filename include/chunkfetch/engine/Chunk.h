/**
 * @file Chunk.h
 * @brief Chunk data structure for byte-range download state
 *
 * A Chunk represents a contiguous byte range of the remote resource.
 * Chunks are downloaded in parallel into their own temp files and merged
 * in index order once all of them have completed.
 */

#pragma once

#include "chunkfetch/engine/Types.h"

#include <QMutex>
#include <QString>

namespace ChunkFetch {

/**
 * @class Chunk
 * @brief One byte range of the download plus its mutable progress state
 *
 * Each chunk:
 * - Has a fixed, inclusive start and end byte position
 * - Tracks bytes written, completion and failure under a per-chunk lock
 * - Counts failed attempts; the count survives resetForRetry()
 * - Owns a deterministic temp file path inside the download's scratch dir
 *
 * Thread Safety:
 * - One worker mutates a chunk at a time; the progress monitor reads it
 *   concurrently. Every accessor of mutable state takes m_mutex.
 */
class Chunk {
public:
    /**
     * @brief Construct a chunk
     * @param index Dense 0-based index within the plan
     * @param startByte First byte of the range (inclusive)
     * @param endByte Last byte of the range (inclusive)
     * @param tempDir Directory holding the chunk's temp file
     */
    Chunk(ChunkIndex index, ByteOffset startByte, ByteOffset endByte, const QString& tempDir);

    // Non-copyable (holds a mutex)
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    ~Chunk() = default;

    // ───────────────────────────────────────────────────────────────────────
    // Identification & Range
    // ───────────────────────────────────────────────────────────────────────

    /// @return Index within the plan
    ChunkIndex index() const { return m_index; }

    /// @return First byte position (inclusive)
    ByteOffset startByte() const { return m_startByte; }

    /// @return Last byte position (inclusive)
    ByteOffset endByte() const { return m_endByte; }

    /// @return Total size of this chunk in bytes
    ByteCount size() const { return m_endByte - m_startByte + 1; }

    /// @return Path of the chunk's temp file (created lazily by a worker)
    QString tempFilePath() const { return m_tempFilePath; }

    /**
     * @brief HTTP Range header value
     * @return String like "bytes=1000-1999"
     */
    QString rangeHeader() const {
        return QStringLiteral("bytes=%1-%2").arg(m_startByte).arg(m_endByte);
    }

    // ───────────────────────────────────────────────────────────────────────
    // Progress
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Record bytes written to the temp file
     *
     * Marks the chunk completed once the total reaches size().
     */
    void updateProgress(ByteCount bytes);

    ByteCount downloaded() const;
    bool isCompleted() const;

    /// @return Progress as a percentage (0.0 to 100.0)
    double progress() const;

    // ───────────────────────────────────────────────────────────────────────
    // Failure & Retry
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Flag the last attempt as failed and count it
     * @param reason Error text kept for diagnostics
     */
    void markFailed(const QString& reason = QString());

    /**
     * @brief Prepare a failed chunk for another attempt
     *
     * Removes the temp file if present, clears downloaded bytes and the
     * failed flag. retryCount() is left untouched.
     */
    void resetForRetry();

    bool isFailed() const;
    int retryCount() const;
    QString lastError() const;

    /// @return True once downloaded and not failed
    bool isGood() const;

    /**
     * @brief Consistent copy of the mutable fields
     */
    struct Snapshot {
        ChunkIndex index;
        ByteCount downloaded;
        bool completed;
        bool failed;
        int retryCount;
    };

    Snapshot snapshot() const;

private:
    // Immutable after construction
    const ChunkIndex m_index;
    const ByteOffset m_startByte;
    const ByteOffset m_endByte;
    const QString m_tempFilePath;

    // Guarded by m_mutex
    mutable QMutex m_mutex;
    ByteCount m_downloaded{0};
    bool m_completed{false};
    bool m_failed{false};
    int m_retryCount{0};
    QString m_lastError;
};

/**
 * @brief Temp file path for a chunk index
 * @return "<tempDir>/chunk_<index>"
 */
QString chunkTempFilePath(const QString& tempDir, ChunkIndex index);

} // namespace ChunkFetch
