#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <portaudio.h>
#include <string>
#include <vector>

#include "settings.hpp"

namespace Audio {

// ------------------------------------------------------------
// InputDevice: microphone frames delivered on the audio thread.
// start() throws VoiceError(CaptureUnavailable).
// ------------------------------------------------------------
class InputDevice {
public:
    using FrameCallback = std::function<void(const float* samples, std::size_t frames)>;

    virtual ~InputDevice() = default;

    virtual void start(FrameCallback cb) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

/// PortAudioInput
/// Mono float32 capture at the configured rate (16 kHz for whisper).
class PortAudioInput : public InputDevice {
public:
    explicit PortAudioInput(const CaptureSettings& settings);
    ~PortAudioInput() override;

    PortAudioInput(const PortAudioInput&) = delete;
    PortAudioInput& operator=(const PortAudioInput&) = delete;

    void start(FrameCallback cb) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }

    // "[index] name — inCh: n, defaultSR: r" for every input-capable device
    static std::vector<std::string> listInputDevices();

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    CaptureSettings settings_;
    PaStream* stream_ = nullptr;
    FrameCallback callback_;
    std::atomic<bool> running_{false};
};

} // namespace Audio
