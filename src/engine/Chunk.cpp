/**
 * @file Chunk.cpp
 * @brief Implementation of Chunk - lock-guarded byte-range state
 */

#include "chunkfetch/engine/Chunk.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>

namespace ChunkFetch {

QString chunkTempFilePath(const QString& tempDir, ChunkIndex index) {
    return QDir(tempDir).filePath(QStringLiteral("chunk_%1").arg(index));
}

Chunk::Chunk(ChunkIndex index, ByteOffset startByte, ByteOffset endByte, const QString& tempDir)
    : m_index(index)
    , m_startByte(startByte)
    , m_endByte(endByte)
    , m_tempFilePath(chunkTempFilePath(tempDir, index))
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// Progress
// ═══════════════════════════════════════════════════════════════════════════════

void Chunk::updateProgress(ByteCount bytes) {
    QMutexLocker locker(&m_mutex);

    m_downloaded += bytes;
    if (m_downloaded >= size()) {
        m_completed = true;
    }
}

ByteCount Chunk::downloaded() const {
    QMutexLocker locker(&m_mutex);
    return m_downloaded;
}

bool Chunk::isCompleted() const {
    QMutexLocker locker(&m_mutex);
    return m_completed;
}

double Chunk::progress() const {
    QMutexLocker locker(&m_mutex);
    return (static_cast<double>(m_downloaded) / size()) * 100.0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Failure & Retry
// ═══════════════════════════════════════════════════════════════════════════════

void Chunk::markFailed(const QString& reason) {
    QMutexLocker locker(&m_mutex);

    m_failed = true;
    ++m_retryCount;
    m_lastError = reason;
}

void Chunk::resetForRetry() {
    QMutexLocker locker(&m_mutex);

    if (QFile::exists(m_tempFilePath) && !QFile::remove(m_tempFilePath)) {
        qWarning() << "Chunk: Failed to remove stale temp file" << m_tempFilePath;
    }

    m_downloaded = 0;
    m_completed = false;
    m_failed = false;
}

bool Chunk::isFailed() const {
    QMutexLocker locker(&m_mutex);
    return m_failed;
}

int Chunk::retryCount() const {
    QMutexLocker locker(&m_mutex);
    return m_retryCount;
}

QString Chunk::lastError() const {
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

bool Chunk::isGood() const {
    QMutexLocker locker(&m_mutex);
    return m_completed && !m_failed;
}

Chunk::Snapshot Chunk::snapshot() const {
    QMutexLocker locker(&m_mutex);
    return Snapshot{m_index, m_downloaded, m_completed, m_failed, m_retryCount};
}

} // namespace ChunkFetch
