#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace Playback {

// ------------------------------------------------------------
// StreamOutput: the output graph for streamed PCM.
// schedule() never blocks on the device.
// ------------------------------------------------------------
class StreamOutput {
public:
    virtual ~StreamOutput() = default;

    // idle → running
    virtual void start(unsigned sampleRate) = 0;

    // Queue normalized mono samples behind what is already scheduled
    virtual void schedule(const float* samples, std::size_t count) = 0;

    // Nothing scheduled is left to play
    virtual bool drained() const = 0;

    // Drop pending audio and go back to idle
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
};

// [-1, 1] → int16, the inverse of Audio::normalizeSample (1.0 saturates at 32767)
std::int16_t toPcm16(float sample);

class PcmSoundStream;

/// SfmlStreamOutput
/// sf::SoundStream fed from a mutex-guarded sample queue; the audio thread
/// plays silence while the queue is empty so the device stays open between
/// network chunks.
class SfmlStreamOutput : public StreamOutput {
public:
    SfmlStreamOutput();
    ~SfmlStreamOutput() override;

    void start(unsigned sampleRate) override;
    void schedule(const float* samples, std::size_t count) override;
    bool drained() const override;
    void stop() override;
    bool isRunning() const override;

private:
    mutable std::mutex mtx_;
    std::unique_ptr<PcmSoundStream> stream_;
};

} // namespace Playback
