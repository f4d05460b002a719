#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>

namespace Audio {

// Normalized loudness (0..1) of one capture frame.
// RMS over a sparse sample (stride = max(1, frames / 256)), scaled ×20 and clamped.
float computeInputLevel(const float* samples, std::size_t frames);

/// LevelMeter
/// Single writer (capture callback) publishes the latest level through an
/// atomic; readers only ever see the last published value. Publication is
/// rate-limited and threshold-gated so the UI is not flooded.
class LevelMeter {
public:
    using Clock = std::chrono::steady_clock;

    LevelMeter(double rateHz = 20.0, float minDelta = 0.03f);

    // Called from the audio callback. Returns true if a new value was published.
    bool update(const float* samples, std::size_t frames);
    bool offer(float level, Clock::time_point now);

    float level() const { return published_.load(std::memory_order_relaxed); }
    void reset();

private:
    Clock::duration minInterval_;
    float minDelta_;
    std::atomic<float> published_{0.0f};
    Clock::time_point lastPublish_{};
};

} // namespace Audio
