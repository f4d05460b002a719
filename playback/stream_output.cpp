#include "stream_output.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <vector>

namespace Playback {

// Samples handed to SFML per onGetData() call
constexpr std::size_t STREAM_CHUNK_SAMPLES = 2048;

std::int16_t toPcm16(float sample) {
    float scaled = std::clamp(sample, -1.0f, 1.0f) * 32768.0f;
    return static_cast<std::int16_t>(std::min(scaled, 32767.0f));
}

// ============================================================
// PcmSoundStream
// ============================================================
class PcmSoundStream : public sf::SoundStream {
public:
    explicit PcmSoundStream(unsigned sampleRate) {
        initialize(1, sampleRate, {sf::SoundChannel::Mono});
        silenceSamples_ = std::max<std::size_t>(1, sampleRate / 50); // 20 ms
    }

    ~PcmSoundStream() override {
        stop();
    }

    void push(const float* samples, std::size_t count) {
        std::lock_guard<std::mutex> lock(queueMutex_);
        for (std::size_t i = 0; i < count; ++i) {
            queue_.push_back(toPcm16(samples[i]));
        }
        idle_ = false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.clear();
    }

    // Queue empty and the last real chunk was handed to the device
    bool drained() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return queue_.empty() && idle_;
    }

protected:
    bool onGetData(Chunk& data) override {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (queue_.empty()) {
            idle_ = true;
            chunk_.assign(silenceSamples_, 0);
        } else {
            std::size_t n = std::min(queue_.size(), STREAM_CHUNK_SAMPLES);
            chunk_.assign(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(n));
            queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(n));
        }
        data.samples = chunk_.data();
        data.sampleCount = chunk_.size();
        return true;
    }

    void onSeek(sf::Time) override {}

private:
    mutable std::mutex queueMutex_;
    std::deque<std::int16_t> queue_;
    std::vector<std::int16_t> chunk_;
    std::size_t silenceSamples_ = 480;
    bool idle_ = true;
};

// ============================================================
// SfmlStreamOutput
// ============================================================
SfmlStreamOutput::SfmlStreamOutput() = default;

SfmlStreamOutput::~SfmlStreamOutput() {
    stop();
}

void SfmlStreamOutput::start(unsigned sampleRate) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stream_) return;
    stream_ = std::make_unique<PcmSoundStream>(sampleRate);
    stream_->play();
    LOG_DEBUG("Playback", "Stream output running at " + std::to_string(sampleRate) + " Hz");
}

void SfmlStreamOutput::schedule(const float* samples, std::size_t count) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!stream_ || count == 0) return;
    stream_->push(samples, count);
}

bool SfmlStreamOutput::drained() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return !stream_ || stream_->drained();
}

void SfmlStreamOutput::stop() {
    std::unique_ptr<PcmSoundStream> old;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        old = std::move(stream_);
    }
    if (old) {
        old->clear();
        old->stop();
        LOG_DEBUG("Playback", "Stream output stopped");
    }
}

bool SfmlStreamOutput::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stream_ != nullptr;
}

} // namespace Playback
