#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <memory>
#include <thread>
#include <vector>

#include "audio/audio_session.hpp"
#include "chat/chat_client.hpp"
#include "error_manager.hpp"
#include "playback/speaker.hpp"
#include "speech/local_synth.hpp"
#include "speech/synthesis_client.hpp"
#include "voice/capture_engine.hpp"

namespace Conversation {

enum class Phase {
    Listening,
    Finalizing,
    Sending,
    Speaking,
    Error       // transient overlay; the machine never rests here
};

const char* phaseName(Phase phase);

// Read-only view for the presentation layer
struct Snapshot {
    bool isRecording = false;
    bool isSpeaking = false;
    bool hasTranscript = false;
    float inputLevel = 0.0f;
    Phase phase = Phase::Listening;
};

// Observer hooks. Phase, notice and reply events fire under the machine's
// lock: handlers must not call back into VoiceConversation.
struct Events {
    std::function<void(Phase)> onPhaseChanged;
    std::function<void(const Notice&)> onNotice;
    std::function<void()> onFirstAudio;
    std::function<void(const Chat::Reply&)> onReply;
    std::function<void(const std::string&)> onTranscript;
    std::function<void(const std::string&)> onTranscriptHandoff;  // unsent text on exit
};

struct Services {
    Voice::CaptureEngine& capture;
    Audio::SessionArbiter& arbiter;
    Playback::Speaker& speaker;
    Speech::SynthesisClient& synthesis;
    Speech::LocalSynthesizer& localVoice;
    Chat::Collaborator& chat;
};

/// VoiceConversation
/// Listening → Finalizing → Sending → Speaking → Listening.
///
/// Triggers are accepted only in the phase they belong to; anything that
/// arrives mid-transition is dropped. Finalizing, Sending and Speaking run
/// on a pipeline worker. Every hand-off out of those phases is tagged with a
/// cycle number, so an interrupt (or exit) that bumps the cycle wins over
/// a completion that lands at the same time.
class VoiceConversation {
public:
    struct Options {
        bool autoResume = true;
        std::chrono::milliseconds finalWait{2500};
    };

    VoiceConversation(Services services, Options options, Events events = {});
    ~VoiceConversation();

    VoiceConversation(const VoiceConversation&) = delete;
    VoiceConversation& operator=(const VoiceConversation&) = delete;

    // --------------------------------------------------------
    // Entry points
    // --------------------------------------------------------
    void onEnterVoiceMode();
    void onExitVoiceMode();
    void onSendTapped();
    void onInterruptTapped();

    Snapshot snapshot() const;
    Phase phase() const { return phase_.load(); }
    bool inVoiceMode() const;
    std::optional<std::string> conversationId() const;

    // Block until the current Finalizing/Sending/Speaking pipeline has returned
    void waitForPipeline();

private:
    void setPhase(Phase phase);
    void emitNotice(const Notice& notice);
    void resumeListening();
    void stopSpeech();

    void runPipeline(std::uint64_t cycle);
    void failSend(std::uint64_t cycle, const VoiceError& error);
    void speakReply(std::uint64_t cycle, std::uint64_t epoch, const std::string& text,
                    const std::optional<std::string>& conversationId);
    bool playFallback(std::uint64_t cycle, const std::string& text);
    void finishSpeaking(std::uint64_t cycle);

    struct Pipeline {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Services services_;
    Options options_;
    Events events_;

    mutable std::mutex mtx_;
    std::atomic<Phase> phase_{Phase::Listening};
    std::uint64_t cycle_ = 0;
    bool active_ = false;
    std::optional<std::string> conversationId_;
    std::vector<Pipeline> pipelines_;   // current one last; older ones may still unwind
};

} // namespace Conversation
