/**
 * @file Types.h
 * @brief Core type definitions and enumerations for the ChunkFetch engine
 *
 * This header defines fundamental types, enumerations, constants and the
 * error value used throughout the download engine.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <QtGlobal>
#include <QString>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using ChunkIndex = int;
using ByteOffset = qint64;
using ByteCount = qint64;
using MonotonicTime = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;
using SpeedBps = double;  // Bytes per second

// ═══════════════════════════════════════════════════════════════════════════════
// Download State Machine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Engine lifecycle states
 *
 * State transitions:
 *   Idle → Probing → MultiThreaded → Validating → Merging → Done
 *              ↓            ↓              ↓           ↓
 *              ↓       SingleThreaded ────────────────→ Done
 *              ↓            ↓              ↓           ↓
 *            Failed ←──── Failed ←──────Failed ←─── Failed
 */
enum class DownloadState : uint8_t {
    Idle,            ///< Created, run() not called yet
    Probing,         ///< Content length and range support (HEAD requests)
    MultiThreaded,   ///< Chunks downloading through the worker pool
    SingleThreaded,  ///< One streamed GET straight into the output file
    Validating,      ///< Checking every chunk completed
    Merging,         ///< Concatenating chunk temp files
    Done,            ///< Output file written
    Failed           ///< Unrecoverable error or cancellation
};

/**
 * @brief Error categories for download failures
 */
enum class ErrorCategory : uint8_t {
    None,
    ProbeFailed,          ///< Metadata request exhausted retries or bad status
    PlanInvalid,          ///< Non-positive content length
    ChunkFetchFailed,     ///< One chunk attempt failed (recoverable)
    IncompleteDownload,   ///< Chunks still missing after the retry pass
    MergeFailed,          ///< Concatenation of chunk files failed
    WriteFailed,          ///< Local write error
    ReadFailed,           ///< Response body broke off mid-stream
    TransferFailed,       ///< Request exhausted its retry budget
    FileSystem,           ///< Scratch directory could not be created
    Cancelled,            ///< Interrupted from outside
    InvalidArgument       ///< Caller supplied unusable input
};

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Constants {
    // Transfer
    constexpr qint64 FILE_BUFFER_SIZE = 32 * 1024;               // 32 KB copy buffer
    constexpr int DEFAULT_MAX_RETRIES = 3;                       // Per-chunk budget

    // Fetch-with-retry
    constexpr int FETCH_ATTEMPTS = 3;
    constexpr Duration FETCH_RETRY_DELAY{2000};                  // 2 seconds, fixed

    // Network timeouts
    constexpr int CONNECT_TIMEOUT_SECONDS = 30;
    constexpr int LOW_SPEED_LIMIT_BYTES = 1;                     // Abort if below 1 B/s
    constexpr int LOW_SPEED_TIME_SECONDS = 30;                   // for 30 seconds
    constexpr int MAX_REDIRECTS = 10;

    // Progress
    constexpr Duration PROGRESS_UPDATE_INTERVAL{100};            // 100ms
    constexpr size_t SPEED_HISTORY_SIZE = 10;                    // Moving-average window
    constexpr int PROGRESS_BAR_WIDTH = 50;

    // HTTP status codes accepted for body transfer
    constexpr long HTTP_OK = 200;
    constexpr long HTTP_PARTIAL_CONTENT = 206;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Error Information
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Detailed error information for failures
 *
 * A default-constructed value means "no error"; operations return it on
 * success.
 */
struct DownloadError {
    ErrorCategory category = ErrorCategory::None;
    long errorCode = 0;                 ///< HTTP status or libcurl code
    QString message;                    ///< Human-readable description
    QString details;                    ///< Underlying cause
    int retryCount = 0;                 ///< Retries attempted for the chunk

    bool hasError() const { return category != ErrorCategory::None; }

    /// @return "message: details", or just the message when there is no cause
    QString toString() const {
        return details.isEmpty() ? message
                                 : QStringLiteral("%1: %2").arg(message, details);
    }

    static DownloadError make(ErrorCategory category, const QString& message,
                              const QString& details = QString(), long code = 0) {
        DownloadError error;
        error.category = category;
        error.errorCode = code;
        error.message = message;
        error.details = details;
        return error;
    }

    /// Wrap @p cause under a new category, keeping its text as the details
    static DownloadError wrap(ErrorCategory category, const QString& message,
                              const DownloadError& cause) {
        DownloadError error = make(category, message, cause.toString(), cause.errorCode);
        error.retryCount = cause.retryCount;
        return error;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief True for the statuses a body may be accepted from (200, 206)
 */
inline bool isAcceptableStatus(long httpCode) {
    return httpCode == Constants::HTTP_OK || httpCode == Constants::HTTP_PARTIAL_CONTENT;
}

/**
 * @brief Convert DownloadState to string for logging/display
 */
inline QString downloadStateToString(DownloadState state) {
    switch (state) {
        case DownloadState::Idle:           return QStringLiteral("Idle");
        case DownloadState::Probing:        return QStringLiteral("Probing");
        case DownloadState::MultiThreaded:  return QStringLiteral("MultiThreaded");
        case DownloadState::SingleThreaded: return QStringLiteral("SingleThreaded");
        case DownloadState::Validating:     return QStringLiteral("Validating");
        case DownloadState::Merging:        return QStringLiteral("Merging");
        case DownloadState::Done:           return QStringLiteral("Done");
        case DownloadState::Failed:         return QStringLiteral("Failed");
        default:                            return QStringLiteral("Unknown");
    }
}

/**
 * @brief Convert ErrorCategory to string
 */
inline QString errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:               return QStringLiteral("None");
        case ErrorCategory::ProbeFailed:        return QStringLiteral("ProbeFailed");
        case ErrorCategory::PlanInvalid:        return QStringLiteral("PlanInvalid");
        case ErrorCategory::ChunkFetchFailed:   return QStringLiteral("ChunkFetchFailed");
        case ErrorCategory::IncompleteDownload: return QStringLiteral("IncompleteDownload");
        case ErrorCategory::MergeFailed:        return QStringLiteral("MergeFailed");
        case ErrorCategory::WriteFailed:        return QStringLiteral("WriteFailed");
        case ErrorCategory::ReadFailed:         return QStringLiteral("ReadFailed");
        case ErrorCategory::TransferFailed:     return QStringLiteral("TransferFailed");
        case ErrorCategory::FileSystem:         return QStringLiteral("FileSystem");
        case ErrorCategory::Cancelled:          return QStringLiteral("Cancelled");
        case ErrorCategory::InvalidArgument:    return QStringLiteral("InvalidArgument");
        default:                                return QStringLiteral("Unknown");
    }
}

/**
 * @brief Format byte count in megabytes (e.g., "1.50 MB")
 */
inline QString formatMegabytes(ByteCount bytes) {
    constexpr double MB = 1024.0 * 1024.0;
    return QStringLiteral("%1 MB").arg(static_cast<double>(bytes) / MB, 0, 'f', 2);
}

/**
 * @brief Format speed for display (e.g., "1.50 MB/s")
 */
inline QString formatSpeed(SpeedBps speed) {
    constexpr double MB = 1024.0 * 1024.0;
    return QStringLiteral("%1 MB/s").arg(speed / MB, 0, 'f', 2);
}

/**
 * @brief Format duration for display (e.g., "2h15m30s")
 */
inline QString formatDuration(Duration duration) {
    auto totalSeconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();

    if (totalSeconds < 0) return QStringLiteral("Unknown");
    if (totalSeconds == 0) return QStringLiteral("0s");

    auto hours = totalSeconds / 3600;
    auto minutes = (totalSeconds % 3600) / 60;
    auto seconds = totalSeconds % 60;

    QString result;
    if (hours > 0) result += QStringLiteral("%1h").arg(hours);
    if (minutes > 0 || hours > 0) result += QStringLiteral("%1m").arg(minutes);
    result += QStringLiteral("%1s").arg(seconds);

    return result;
}

} // namespace ChunkFetch
