/**
 * @file FileMerger.h
 * @brief Reassembly of chunk temp files into the output file
 */

#pragma once

#include "chunkfetch/engine/Types.h"

#include <QString>
#include <QStringList>

class QFile;

namespace ChunkFetch {

/**
 * @class FileMerger
 * @brief Concatenates chunk files, in the given order, into one output
 */
class FileMerger {
public:
    /**
     * @brief Copy every file of @p chunkFiles into @p outputPath
     *
     * Each input is closed right after its copy. On failure the partially
     * written output is left in place for the caller to remove.
     *
     * @param outputPath Destination; parent directories are created
     * @param chunkFiles Inputs ordered by chunk index
     * @return MergeFailed wrapping the cause, or an empty error
     */
    static DownloadError merge(const QString& outputPath, const QStringList& chunkFiles);

    /**
     * @brief Create (truncate) @p path for writing, making parent directories
     * @param file Unopened file object to open
     * @param error Receives WriteFailed on failure
     */
    static bool createOutputFile(QFile& file, const QString& path, DownloadError* error);
};

} // namespace ChunkFetch
