/**
 * @file ChunkPlanner.cpp
 * @brief Implementation of ChunkPlanner and DownloadPlan
 */

#include "chunkfetch/engine/ChunkPlanner.h"

#include <algorithm>
#include <QDebug>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// DownloadPlan
// ═══════════════════════════════════════════════════════════════════════════════

DownloadPlan::DownloadPlan(ByteCount contentLength, std::vector<std::unique_ptr<Chunk>> chunks)
    : m_contentLength(contentLength)
    , m_chunks(std::move(chunks))
{
}

std::vector<Chunk*> DownloadPlan::chunks() const {
    std::vector<Chunk*> result;
    result.reserve(m_chunks.size());

    for (const auto& chunk : m_chunks) {
        result.push_back(chunk.get());
    }

    return result;
}

QStringList DownloadPlan::tempFilePaths() const {
    QStringList paths;
    paths.reserve(static_cast<qsizetype>(m_chunks.size()));

    for (const auto& chunk : m_chunks) {
        paths.append(chunk->tempFilePath());
    }

    return paths;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Planning
// ═══════════════════════════════════════════════════════════════════════════════

int ChunkPlanner::effectiveChunkCount(ByteCount contentLength, int requestedThreads) {
    if (contentLength <= 0) {
        return 0;
    }

    ByteCount threads = std::max(requestedThreads, 1);
    return static_cast<int>(std::min(threads, contentLength));
}

std::unique_ptr<DownloadPlan> ChunkPlanner::plan(ByteCount contentLength,
                                                 int requestedThreads,
                                                 const QString& tempDir,
                                                 DownloadError* error) {
    if (contentLength <= 0) {
        if (error) {
            *error = DownloadError::make(ErrorCategory::PlanInvalid,
                                         QStringLiteral("Invalid file size: %1").arg(contentLength));
        }
        return nullptr;
    }

    const int chunkCount = effectiveChunkCount(contentLength, requestedThreads);
    const ByteCount chunkSize = contentLength / chunkCount;

    std::vector<std::unique_ptr<Chunk>> chunks;
    chunks.reserve(static_cast<size_t>(chunkCount));

    for (int i = 0; i < chunkCount; ++i) {
        ByteOffset startByte = static_cast<ByteOffset>(i) * chunkSize;
        ByteOffset endByte = (i == chunkCount - 1) ? contentLength - 1
                                                   : startByte + chunkSize - 1;

        chunks.push_back(std::make_unique<Chunk>(i, startByte, endByte, tempDir));
    }

    qDebug() << "ChunkPlanner: Planned" << chunkCount << "chunks of" << chunkSize
             << "bytes for" << contentLength << "bytes";

    return std::make_unique<DownloadPlan>(contentLength, std::move(chunks));
}

bool validateChunks(const std::vector<Chunk*>& chunks) {
    return std::all_of(chunks.begin(), chunks.end(), [](const Chunk* chunk) {
        return chunk->isGood();
    });
}

} // namespace ChunkFetch
