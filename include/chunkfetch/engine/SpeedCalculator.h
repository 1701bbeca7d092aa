/**
 * @file SpeedCalculator.h
 * @brief Moving-average speed and ETA calculation
 */

#pragma once

#include "chunkfetch/engine/Types.h"

#include <deque>
#include <optional>

namespace ChunkFetch {

/**
 * @class SpeedCalculator
 * @brief Averages the most recent speed samples
 *
 * Not thread-safe; ProgressMonitor serialises access.
 */
class SpeedCalculator {
public:
    explicit SpeedCalculator(size_t sampleCount = Constants::SPEED_HISTORY_SIZE);

    /// Push a sample; the oldest one drops out once the window is full
    void addSample(SpeedBps bytesPerSecond);

    /// @return Mean of the windowed samples (0 with no samples)
    SpeedBps averageSpeed() const;

    /// @return Most recent sample
    SpeedBps currentSpeed() const { return m_window.empty() ? 0.0 : m_window.back(); }

    /**
     * @brief Time to transfer @p remainingBytes at the average speed
     * @return nullopt while the average is zero
     */
    std::optional<Duration> calculateETA(ByteCount remainingBytes) const;

    void reset() { m_window.clear(); }

    size_t sampleCount() const { return m_window.size(); }

private:
    std::deque<SpeedBps> m_window;
    size_t m_maxSamples;
};

} // namespace ChunkFetch
