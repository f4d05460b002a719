#pragma once
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "recognizer.hpp"
#include "settings.hpp"

// Forward declare
struct whisper_context;

namespace Voice {

/// WhisperRecognizer
/// Incremental whisper.cpp transcription. The session audio is re-run every
/// `stepMs` of new input so each hypothesis replaces the last one; audio
/// beyond `windowMs` is committed (its text frozen) and dropped.
class WhisperRecognizer : public Recognizer {
public:
    WhisperRecognizer(const WhisperSettings& settings, double sampleRate);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    bool isAvailable() override;
    void beginSession(Callbacks callbacks) override;
    void appendAudio(const float* samples, std::size_t count) override;
    void endAudio() override;
    void cancel() override;

private:
    bool ensureWhisperLoaded();
    void run(Callbacks callbacks);
    bool transcribe(const std::vector<float>& pcm, std::string& text);
    void joinWorker();

    WhisperSettings settings_;
    double sampleRate_;
    whisper_context* ctx_ = nullptr;
    std::mutex loadMutex_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<float> pending_;
    bool ending_ = false;
    bool cancelled_ = false;
    std::thread worker_;
};

} // namespace Voice
