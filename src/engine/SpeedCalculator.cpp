/**
 * @file SpeedCalculator.cpp
 * @brief Speed calculation and ETA estimation utilities
 */

#include "chunkfetch/engine/SpeedCalculator.h"

#include <algorithm>
#include <numeric>

namespace ChunkFetch {

SpeedCalculator::SpeedCalculator(size_t sampleCount)
    : m_maxSamples(std::max<size_t>(sampleCount, 1))
{
}

void SpeedCalculator::addSample(SpeedBps bytesPerSecond) {
    m_window.push_back(bytesPerSecond);

    if (m_window.size() > m_maxSamples) {
        m_window.pop_front();
    }
}

SpeedBps SpeedCalculator::averageSpeed() const {
    if (m_window.empty()) {
        return 0.0;
    }

    double sum = std::accumulate(m_window.begin(), m_window.end(), 0.0);
    return sum / static_cast<double>(m_window.size());
}

std::optional<Duration> SpeedCalculator::calculateETA(ByteCount remainingBytes) const {
    SpeedBps speed = averageSpeed();

    if (speed <= 0) {
        return std::nullopt;
    }

    double seconds = static_cast<double>(std::max<ByteCount>(remainingBytes, 0)) / speed;
    return Duration{static_cast<Duration::rep>(seconds * 1000)};
}

} // namespace ChunkFetch
