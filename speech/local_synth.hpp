#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace Speech {

// ------------------------------------------------------------
// LocalSynthesizer: on-device speech, last link of the fallback
// chain. speak() blocks until done; stop() interrupts it and
// latches until rearm().
// ------------------------------------------------------------
class LocalSynthesizer {
public:
    virtual ~LocalSynthesizer() = default;

    // false when stopped early or the synthesizer could not run
    virtual bool speak(const std::string& text) = 0;
    virtual void stop() = 0;
    virtual void rearm() = 0;
    virtual bool isSpeaking() const = 0;
};

/// ProcessSynthesizer
/// Runs an external TTS program (espeak-ng by default) with the text as the
/// last argument; stop() terminates the child.
class ProcessSynthesizer : public LocalSynthesizer {
public:
    explicit ProcessSynthesizer(std::vector<std::string> command);
    ~ProcessSynthesizer() override;

    bool speak(const std::string& text) override;
    void stop() override;
    void rearm() override { stopRequested_ = false; }
    bool isSpeaking() const override;

private:
    std::vector<std::string> command_;
    mutable std::mutex mtx_;
    pid_t child_ = -1;
    std::atomic<bool> stopRequested_{false};
};

} // namespace Speech
