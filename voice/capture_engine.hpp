#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "audio/audio_input.hpp"
#include "audio/level_meter.hpp"
#include "error_manager.hpp"
#include "recognizer.hpp"
#include "settings.hpp"

namespace Voice {

/// CaptureEngine
/// Microphone capture plus one continuous recognition session. The
/// transcript buffer is written only by recognizer callbacks and cleared
/// only by finalizeTranscript(). Hypotheses from a session that was already
/// finalized (or replaced by a new one) are dropped.
class CaptureEngine {
public:
    using HypothesisCallback = std::function<void(const std::string& transcript)>;
    using FailureCallback = std::function<void(const VoiceError& error)>;

    CaptureEngine(Audio::InputDevice& input, Recognizer& recognizer,
                  const LevelMeterSettings& meter = {});
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    // Throws VoiceError(CaptureUnavailable)
    void startCapture();

    // End-of-audio is signalled; the final hypothesis may still land
    void stopCapture();

    // Blocks until the session being finalized delivered its final pass
    // (or failed, or was finalized elsewhere). False on timeout.
    bool waitForFinal(std::chrono::milliseconds timeout);

    // Trimmed transcript; the buffer is empty afterwards
    std::string finalizeTranscript();

    bool isCapturing() const { return capturing_.load(); }
    bool hasTranscript() const;
    float inputLevel() const { return meter_.level(); }

    void setHypothesisCallback(HypothesisCallback cb);
    void setFailureCallback(FailureCallback cb);

private:
    void onFrames(const float* samples, std::size_t frames);
    void onHypothesis(std::uint64_t session, const std::string& text);
    void onFailure(std::uint64_t session, const VoiceError& error);
    void autoStop(std::uint64_t session);
    void markComplete(std::uint64_t session);

    Audio::InputDevice& input_;
    Recognizer& recognizer_;
    Audio::LevelMeter meter_;

    std::mutex deviceMutex_;               // start / stop of device + session
    std::atomic<bool> capturing_{false};
    std::atomic<std::uint64_t> captureSession_{0};

    mutable std::mutex transcriptMutex_;
    std::string transcript_;
    std::uint64_t transcriptSession_ = 0;  // session allowed to write transcript_
    std::uint64_t completedSession_ = 0;   // newest session whose recognizer is done
    std::condition_variable finalCv_;

    std::mutex callbackMutex_;
    HypothesisCallback hypothesisCb_;
    FailureCallback failureCb_;
};

} // namespace Voice
