#pragma once
#include <cstddef>
#include <functional>
#include <string>

#include "error_manager.hpp"

namespace Voice {

// ------------------------------------------------------------
// Recognizer: continuous speech-to-text session.
// Callbacks arrive on the recognizer's own thread.
// ------------------------------------------------------------
class Recognizer {
public:
    struct Callbacks {
        std::function<void(const std::string& hypothesis)> onHypothesis; // replaces the previous one
        std::function<void(const std::string& finalText)> onComplete;    // after endAudio()
        std::function<void(const VoiceError& error)> onError;
    };

    virtual ~Recognizer() = default;

    // Model loaded / service reachable
    virtual bool isAvailable() = 0;

    virtual void beginSession(Callbacks callbacks) = 0;

    // Audio thread: must not block for long
    virtual void appendAudio(const float* samples, std::size_t count) = 0;

    // No more audio; a final hypothesis may still arrive
    virtual void endAudio() = 0;

    // Drop the session without a final result
    virtual void cancel() = 0;
};

} // namespace Voice
