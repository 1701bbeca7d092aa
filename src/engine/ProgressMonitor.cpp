/**
 * @file ProgressMonitor.cpp
 * @brief Implementation of ProgressMonitor - progress sampling and rendering
 */

#include "chunkfetch/engine/ProgressMonitor.h"

#include <algorithm>

#include <QDebug>
#include <QMutexLocker>
#include <QTextStream>
#include <QThread>

namespace ChunkFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// ProgressSnapshot
// ═══════════════════════════════════════════════════════════════════════════════

QString ProgressSnapshot::toString() const {
    return QStringLiteral("%1 %2% %3/%4 (%5) ETA: %6")
        .arg(bar)
        .arg(progressPercent, 0, 'f', 2)
        .arg(formatMegabytes(downloadedBytes),
             formatMegabytes(totalBytes),
             formatSpeed(currentSpeed),
             eta ? formatDuration(*eta) : QStringLiteral("--"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

ProgressMonitor::ProgressMonitor(ByteCount totalBytes, std::vector<Chunk*> chunks)
    : m_totalBytes(totalBytes)
    , m_chunks(std::move(chunks))
    , m_trackChunks(true)
    , m_startTime(std::chrono::steady_clock::now())
{
    m_snapshot.totalBytes = totalBytes;
    m_snapshot.bar = renderBar(0, totalBytes);
}

ProgressMonitor::ProgressMonitor(ByteCount totalBytes)
    : m_totalBytes(totalBytes)
    , m_trackChunks(false)
    , m_startTime(std::chrono::steady_clock::now())
{
    m_snapshot.totalBytes = totalBytes;
    m_snapshot.bar = renderBar(0, totalBytes);
}

ProgressMonitor::~ProgressMonitor() {
    if (m_thread) {
        {
            QMutexLocker locker(&m_stopMutex);
            m_stopRequested = true;
        }
        m_stopCondition.wakeAll();
        m_thread->wait();
    }
}

void ProgressMonitor::setStartTime(MonotonicTime start) {
    QMutexLocker locker(&m_mutex);
    m_startTime = start;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Sampling
// ═══════════════════════════════════════════════════════════════════════════════

ByteCount ProgressMonitor::downloadedBytes() const {
    if (!m_trackChunks) {
        return m_streamBytes.load(std::memory_order_relaxed);
    }

    ByteCount total = 0;
    for (const Chunk* chunk : m_chunks) {
        total += chunk->downloaded();
    }
    return total;
}

ProgressSnapshot ProgressMonitor::update() {
    return update(std::chrono::steady_clock::now());
}

ProgressSnapshot ProgressMonitor::update(MonotonicTime now) {
    const ByteCount downloaded = downloadedBytes();

    QMutexLocker locker(&m_mutex);

    auto elapsed = std::chrono::duration_cast<Duration>(now - m_startTime);
    m_snapshot.elapsed = elapsed;

    const double elapsedSeconds = static_cast<double>(elapsed.count()) / 1000.0;
    if (elapsedSeconds > 0) {
        SpeedBps instantaneous = static_cast<double>(downloaded) / elapsedSeconds;
        m_speed.addSample(instantaneous);

        m_snapshot.currentSpeed = instantaneous;
        m_snapshot.averageSpeed = m_speed.averageSpeed();

        // Keep the previous estimate while no speed is known
        if (auto eta = m_speed.calculateETA(m_totalBytes - downloaded)) {
            m_snapshot.eta = eta;
        }
    }

    m_snapshot.downloadedBytes = downloaded;
    m_snapshot.totalBytes = m_totalBytes;

    if (m_totalBytes > 0) {
        m_snapshot.progressPercent = static_cast<double>(downloaded) * 100.0
                                     / static_cast<double>(m_totalBytes);
    }

    m_snapshot.bar = renderBar(downloaded, m_totalBytes);

    return m_snapshot;
}

ProgressSnapshot ProgressMonitor::snapshot() const {
    QMutexLocker locker(&m_mutex);
    return m_snapshot;
}

QString ProgressMonitor::renderBar(ByteCount downloaded, ByteCount total, int width) {
    int completed = 0;
    if (total > 0) {
        completed = static_cast<int>(static_cast<double>(width) * static_cast<double>(downloaded)
                                     / static_cast<double>(total));
        completed = std::clamp(completed, 0, width);
    }

    QString bar;
    bar.reserve(width + 2);
    bar += QLatin1Char('[');

    for (int i = 0; i < width; ++i) {
        if (i < completed) {
            bar += QLatin1Char('=');
        } else if (i == completed) {
            bar += QLatin1Char('>');
        } else {
            bar += QLatin1Char(' ');
        }
    }

    bar += QLatin1Char(']');
    return bar;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Periodic Reporting
// ═══════════════════════════════════════════════════════════════════════════════

void ProgressMonitor::start(Duration interval) {
    if (m_thread) {
        qWarning() << "ProgressMonitor: Already running";
        return;
    }

    {
        QMutexLocker locker(&m_stopMutex);
        m_stopRequested = false;
    }

    m_thread.reset(QThread::create([this, interval]() { tickLoop(interval); }));
    m_thread->start();
}

void ProgressMonitor::tickLoop(Duration interval) {
    QMutexLocker locker(&m_stopMutex);

    while (!m_stopRequested) {
        m_stopCondition.wait(&m_stopMutex, static_cast<unsigned long>(interval.count()));
        if (m_stopRequested) {
            break;
        }

        locker.unlock();
        render(update());
        locker.relock();
    }
}

void ProgressMonitor::stop() {
    if (!m_thread) {
        return;
    }

    {
        QMutexLocker locker(&m_stopMutex);
        m_stopRequested = true;
    }
    m_stopCondition.wakeAll();
    m_thread->wait();
    m_thread.reset();

    render(update());
    if (m_output) {
        *m_output << Qt::endl;
    }
}

bool ProgressMonitor::isRunning() const {
    return m_thread != nullptr;
}

void ProgressMonitor::render(const ProgressSnapshot& snapshot) {
    if (!m_output) {
        return;
    }

    *m_output << '\r' << snapshot.toString();
    m_output->flush();
}

void ProgressMonitor::printSummary() {
    if (!m_output) {
        return;
    }

    ProgressSnapshot current = snapshot();

    *m_output << Qt::endl << "Download Summary:" << Qt::endl
              << "Total size: " << formatMegabytes(current.totalBytes) << Qt::endl
              << "Time taken: " << formatDuration(current.elapsed) << Qt::endl
              << "Average speed: " << formatSpeed(current.averageSpeed) << Qt::endl;
}

} // namespace ChunkFetch
