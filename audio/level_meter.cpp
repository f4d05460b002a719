#include "level_meter.hpp"

#include <algorithm>
#include <cmath>

namespace Audio {

float computeInputLevel(const float* samples, std::size_t frames) {
    if (!samples || frames == 0) return 0.0f;

    // Sample sparsely to keep the callback cheap
    const std::size_t stride = std::max<std::size_t>(1, frames / 256);
    float sumOfSquares = 0.0f;
    std::size_t counted = 0;
    for (std::size_t i = 0; i < frames; i += stride) {
        sumOfSquares += samples[i] * samples[i];
        ++counted;
    }

    const float rms = std::sqrt(sumOfSquares / static_cast<float>(counted));
    // Speech RMS sits around 0..0.1; map to 0..1 for the UI
    return std::min(std::max(rms * 20.0f, 0.0f), 1.0f);
}

LevelMeter::LevelMeter(double rateHz, float minDelta)
    : minInterval_(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(rateHz > 0.0 ? 1.0 / rateHz : 0.0))),
      minDelta_(minDelta) {}

bool LevelMeter::update(const float* samples, std::size_t frames) {
    return offer(computeInputLevel(samples, frames), Clock::now());
}

bool LevelMeter::offer(float level, Clock::time_point now) {
    const float current = published_.load(std::memory_order_relaxed);
    if (std::fabs(level - current) < minDelta_) return false;
    if (lastPublish_ != Clock::time_point{} && now - lastPublish_ < minInterval_) return false;

    published_.store(level, std::memory_order_relaxed);
    lastPublish_ = now;
    return true;
}

void LevelMeter::reset() {
    published_.store(0.0f, std::memory_order_relaxed);
    lastPublish_ = Clock::time_point{};
}

} // namespace Audio
