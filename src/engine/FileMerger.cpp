/**
 * @file FileMerger.cpp
 * @brief Implementation of FileMerger
 */

#include "chunkfetch/engine/FileMerger.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <vector>

namespace ChunkFetch {

bool FileMerger::createOutputFile(QFile& file, const QString& path, DownloadError* error) {
    const QString parent = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parent)) {
        if (error) {
            *error = DownloadError::make(ErrorCategory::WriteFailed,
                                         QStringLiteral("Failed to create directory"),
                                         parent);
        }
        return false;
    }

    file.setFileName(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) {
            *error = DownloadError::make(ErrorCategory::WriteFailed,
                                         QStringLiteral("Failed to create output file"),
                                         file.errorString());
        }
        return false;
    }

    return true;
}

DownloadError FileMerger::merge(const QString& outputPath, const QStringList& chunkFiles) {
    qDebug() << "FileMerger: Merging" << chunkFiles.size() << "chunks to" << outputPath;

    auto mergeFailed = [](const DownloadError& cause) {
        return DownloadError::wrap(ErrorCategory::MergeFailed,
                                   QStringLiteral("Failed to merge chunks"), cause);
    };

    QFile outputFile;
    DownloadError error;
    if (!createOutputFile(outputFile, outputPath, &error)) {
        return mergeFailed(error);
    }

    std::vector<char> buffer(static_cast<size_t>(Constants::FILE_BUFFER_SIZE));

    for (const QString& chunkPath : chunkFiles) {
        QFile chunkFile(chunkPath);

        if (!chunkFile.open(QIODevice::ReadOnly)) {
            qWarning() << "FileMerger: Failed to open chunk file:" << chunkPath;
            return mergeFailed(DownloadError::make(ErrorCategory::ReadFailed,
                                                   QStringLiteral("Failed to open chunk file %1")
                                                       .arg(chunkPath),
                                                   chunkFile.errorString()));
        }

        while (!chunkFile.atEnd()) {
            qint64 read = chunkFile.read(buffer.data(), Constants::FILE_BUFFER_SIZE);
            if (read < 0) {
                return mergeFailed(DownloadError::make(ErrorCategory::ReadFailed,
                                                       QStringLiteral("Failed to read chunk file %1")
                                                           .arg(chunkPath),
                                                       chunkFile.errorString()));
            }
            if (read == 0) break;

            qint64 written = outputFile.write(buffer.data(), read);
            if (written != read) {
                qWarning() << "FileMerger: Write error during merge";
                return mergeFailed(DownloadError::make(ErrorCategory::WriteFailed,
                                                       QStringLiteral("Failed to copy chunk file %1")
                                                           .arg(chunkPath),
                                                       outputFile.errorString()));
            }
        }

        chunkFile.close();
    }

    if (!outputFile.flush()) {
        return mergeFailed(DownloadError::make(ErrorCategory::WriteFailed,
                                               QStringLiteral("Failed to flush output file"),
                                               outputFile.errorString()));
    }
    outputFile.close();

    qDebug() << "FileMerger: Merge complete";
    return {};
}

} // namespace ChunkFetch
