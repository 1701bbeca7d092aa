/**
 * @file ProgressMonitor.h
 * @brief Periodic aggregation and rendering of download progress
 */

#pragma once

#include "chunkfetch/engine/Types.h"
#include "chunkfetch/engine/Chunk.h"
#include "chunkfetch/engine/SpeedCalculator.h"

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include <QMutex>
#include <QString>
#include <QWaitCondition>

class QTextStream;
class QThread;

namespace ChunkFetch {

/**
 * @brief Derived progress state, recomputed on every tick
 */
struct ProgressSnapshot {
    ByteCount downloadedBytes = 0;      ///< Aggregate bytes received
    ByteCount totalBytes = 0;           ///< Total resource size
    double progressPercent = 0.0;       ///< 0.0 to 100.0
    SpeedBps currentSpeed = 0.0;        ///< Bytes since start / elapsed
    SpeedBps averageSpeed = 0.0;        ///< Mean of the last samples
    std::optional<Duration> eta;        ///< Unknown until a speed is known
    Duration elapsed{0};                ///< Since monitor start
    QString bar;                        ///< "[=====>    ]"

    /// @return One status line (bar, percent, sizes, speed, ETA)
    QString toString() const;
};

/**
 * @class ProgressMonitor
 * @brief Samples chunk progress on a fixed interval
 *
 * Two sources are supported:
 * - a multi-chunk plan: downloaded bytes are summed over the chunks
 * - a single stream: the caller feeds addBytes()
 *
 * The monitor only observes; nothing it computes feeds back into chunk
 * state. start() spawns a QThread that ticks until stop().
 */
class ProgressMonitor {
public:
    /**
     * @brief Track a chunked download
     * @param totalBytes Resource size
     * @param chunks Chunks to sum (not owned)
     */
    ProgressMonitor(ByteCount totalBytes, std::vector<Chunk*> chunks);

    /**
     * @brief Track a single stream fed through addBytes()
     */
    explicit ProgressMonitor(ByteCount totalBytes);

    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    /**
     * @brief Destination for the rendered bar and summary
     *
     * nullptr (the default) keeps the monitor silent.
     */
    void setOutput(QTextStream* output) { m_output = output; }

    /// @brief Reference point for elapsed time and speed
    void setStartTime(MonotonicTime start);

    // ───────────────────────────────────────────────────────────────────────
    // Single-stream counter
    // ───────────────────────────────────────────────────────────────────────

    void addBytes(ByteCount bytes) { m_streamBytes.fetch_add(bytes, std::memory_order_relaxed); }

    // ───────────────────────────────────────────────────────────────────────
    // Sampling
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Recompute the snapshot as of @p now
     */
    ProgressSnapshot update(MonotonicTime now);

    /// @brief Recompute the snapshot as of the current time
    ProgressSnapshot update();

    /// @return Last computed snapshot
    ProgressSnapshot snapshot() const;

    /// @return Bytes currently reported by the source
    ByteCount downloadedBytes() const;

    // ───────────────────────────────────────────────────────────────────────
    // Periodic reporting
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Start ticking on a background thread
     */
    void start(Duration interval = Constants::PROGRESS_UPDATE_INTERVAL);

    /**
     * @brief Stop ticking, then do a final update and render
     *
     * Idempotent. The summary is printed by printSummary().
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Print total size, elapsed time and average speed
     */
    void printSummary();

    /**
     * @brief Build a bracketed bar of @p width cells
     *
     * '=' for the completed proportion, one '>' transition cell, spaces for
     * the rest.
     */
    static QString renderBar(ByteCount downloaded, ByteCount total,
                             int width = Constants::PROGRESS_BAR_WIDTH);

private:
    void tickLoop(Duration interval);
    void render(const ProgressSnapshot& snapshot);

    // Source
    const ByteCount m_totalBytes;
    const std::vector<Chunk*> m_chunks;
    const bool m_trackChunks;
    std::atomic<ByteCount> m_streamBytes{0};

    // Derived state
    mutable QMutex m_mutex;
    MonotonicTime m_startTime;
    SpeedCalculator m_speed;
    ProgressSnapshot m_snapshot;

    // Ticker
    std::unique_ptr<QThread> m_thread;
    QMutex m_stopMutex;
    QWaitCondition m_stopCondition;
    bool m_stopRequested{false};

    QTextStream* m_output{nullptr};
};

} // namespace ChunkFetch
