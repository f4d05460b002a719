#include "voice_conversation.hpp"
#include "logger.hpp"

namespace Conversation {

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::Listening:  return "listening";
        case Phase::Finalizing: return "finalizing";
        case Phase::Sending:    return "sending";
        case Phase::Speaking:   return "speaking";
        case Phase::Error:      return "error";
    }
    return "?";
}

VoiceConversation::VoiceConversation(Services services, Options options, Events events)
    : services_(services), options_(options), events_(std::move(events)) {
    // Leaving a mode stops whatever runs on it
    services_.arbiter.setExitHandler(Audio::SessionMode::Record, [this]() {
        services_.capture.stopCapture();
    });
    services_.arbiter.setExitHandler(Audio::SessionMode::Playback, [this]() {
        stopSpeech();
    });

    services_.capture.setHypothesisCallback([this](const std::string& transcript) {
        if (events_.onTranscript) events_.onTranscript(transcript);
    });
    services_.capture.setFailureCallback([](const VoiceError& error) {
        ErrorManager::report(error);
    });
    services_.speaker.setFirstAudioCallback([this]() {
        LOG_DEBUG("Conversation", "First audio");
        if (events_.onFirstAudio) events_.onFirstAudio();
    });
}

VoiceConversation::~VoiceConversation() {
    onExitVoiceMode();
    waitForPipeline();

    services_.arbiter.setExitHandler(Audio::SessionMode::Record, nullptr);
    services_.arbiter.setExitHandler(Audio::SessionMode::Playback, nullptr);
    services_.capture.setHypothesisCallback(nullptr);
    services_.capture.setFailureCallback(nullptr);
    services_.speaker.setFirstAudioCallback(nullptr);
}

// ============================================================
// Helpers (caller holds mtx_)
// ============================================================
void VoiceConversation::setPhase(Phase phase) {
    Phase old = phase_.exchange(phase);
    if (old == phase) return;
    LOG_DEBUG("Conversation", std::string(phaseName(old)) + " -> " + phaseName(phase));
    if (events_.onPhaseChanged) events_.onPhaseChanged(phase);
}

void VoiceConversation::emitNotice(const Notice& notice) {
    if (events_.onNotice) events_.onNotice(notice);
}

void VoiceConversation::resumeListening() {
    try {
        services_.arbiter.configure(Audio::SessionMode::Record);
        if (!services_.capture.isCapturing()) services_.capture.startCapture();
    } catch (const VoiceError& e) {
        // Logged only; the user can retry by tapping send
        ErrorManager::report(e);
    }
    setPhase(Phase::Listening);
}

void VoiceConversation::stopSpeech() {
    services_.synthesis.cancel();
    services_.speaker.stopAll();
    services_.localVoice.stop();
}

// ============================================================
// Entry points
// ============================================================
void VoiceConversation::onEnterVoiceMode() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_) return;
    active_ = true;
    ++cycle_;
    LOG_PHASE("Voice mode entered", true);
    resumeListening();
}

void VoiceConversation::onExitVoiceMode() {
    std::string handoff;
    std::vector<Pipeline> unwinding;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!active_) return;
        active_ = false;
        ++cycle_;

        stopSpeech();
        services_.capture.stopCapture();
        handoff = services_.capture.finalizeTranscript();
        services_.arbiter.release(Audio::SessionMode::Record);
        services_.arbiter.release(Audio::SessionMode::Playback);
        setPhase(Phase::Listening);
        unwinding.swap(pipelines_);
    }

    for (auto& p : unwinding) {
        if (p.thread.joinable()) p.thread.join();
    }
    LOG_PHASE("Voice mode exited", true);

    if (!handoff.empty()) {
        LOG_DEBUG("Conversation", "Handing off unsent transcript: " + handoff);
        if (events_.onTranscriptHandoff) events_.onTranscriptHandoff(handoff);
    }
}

void VoiceConversation::onSendTapped() {
    std::vector<Pipeline> finished;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!active_ || phase_ != Phase::Listening) {
            LOG_TRACE("Conversation", std::string("Send ignored while ") + phaseName(phase_));
            return;
        }

        if (!services_.capture.hasTranscript()) {
            emitNotice(ErrorManager::report(ErrorKind::NoSpeech));
            // Capture may be off (auto-resume disabled, recognizer ended)
            if (!services_.capture.isCapturing()) resumeListening();
            return;
        }

        setPhase(Phase::Finalizing);
        services_.capture.stopCapture();
        const std::uint64_t cycle = ++cycle_;

        // Reap pipelines that already returned
        for (auto it = pipelines_.begin(); it != pipelines_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = pipelines_.erase(it);
            } else {
                ++it;
            }
        }

        Pipeline p;
        p.done = std::make_shared<std::atomic<bool>>(false);
        p.thread = std::thread([this, cycle, done = p.done]() {
            runPipeline(cycle);
            done->store(true);
        });
        pipelines_.push_back(std::move(p));
    }

    for (auto& p : finished) {
        if (p.thread.joinable()) p.thread.join();
    }
}

void VoiceConversation::onInterruptTapped() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!active_ || phase_ != Phase::Speaking) {
        LOG_TRACE("Conversation", std::string("Interrupt ignored while ") + phaseName(phase_));
        return;
    }

    ++cycle_;
    LOG_DEBUG("Conversation", "Interrupted");
    stopSpeech();
    resumeListening();
}

void VoiceConversation::waitForPipeline() {
    std::vector<Pipeline> pending;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending.swap(pipelines_);
    }
    for (auto& p : pending) {
        if (p.thread.joinable()) p.thread.join();
    }
}

// ============================================================
// Observers
// ============================================================
Snapshot VoiceConversation::snapshot() const {
    Snapshot s;
    s.phase = phase_.load();
    s.isRecording = services_.capture.isCapturing();
    s.isSpeaking = (s.phase == Phase::Speaking);
    s.hasTranscript = services_.capture.hasTranscript();
    s.inputLevel = services_.capture.inputLevel();
    return s;
}

bool VoiceConversation::inVoiceMode() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return active_;
}

std::optional<std::string> VoiceConversation::conversationId() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return conversationId_;
}

// ============================================================
// Pipeline worker: Finalizing → Sending → Speaking → Listening
// ============================================================
void VoiceConversation::runPipeline(std::uint64_t cycle) {
    // The tail of the utterance arrives with the final pass; exit wakes this early
    services_.capture.waitForFinal(options_.finalWait);

    std::string text;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cycle != cycle_) return;
        text = services_.capture.finalizeTranscript();
        if (text.empty()) {
            emitNotice(ErrorManager::report(ErrorKind::NoSpeech));
            resumeListening();
            return;
        }
        setPhase(Phase::Sending);
    }

    LOG_DEBUG("Conversation", "Sending: \"" + text + "\"");

    Chat::Reply reply;
    try {
        reply = services_.chat.sendMessage(text);
    } catch (const VoiceError& e) {
        failSend(cycle, e);
        return;
    } catch (const std::exception& e) {
        failSend(cycle, VoiceError(ErrorKind::NetworkFailure, e.what()));
        return;
    }

    std::optional<std::string> conversationId;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cycle != cycle_) return;
        if (reply.conversationId) conversationId_ = reply.conversationId;
        conversationId = conversationId_;
        // Any stop from here on cancels this reply's synthesis
        epoch = services_.synthesis.epoch();
        if (events_.onReply) events_.onReply(reply);
        setPhase(Phase::Speaking);
    }

    if (reply.content.find_first_not_of(" \t\n\r") != std::string::npos) {
        speakReply(cycle, epoch, reply.content, conversationId);
    } else {
        LOG_DEBUG("Conversation", "Empty reply, nothing to speak");
    }
    finishSpeaking(cycle);
}

void VoiceConversation::failSend(std::uint64_t cycle, const VoiceError& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (cycle != cycle_) return;
    Notice notice = ErrorManager::report(error);
    setPhase(Phase::Error);
    emitNotice(notice);
    resumeListening();
}

void VoiceConversation::speakReply(std::uint64_t cycle, std::uint64_t epoch, const std::string& text,
                                   const std::optional<std::string>& conversationId) {
    using Kind = Speech::Synthesis::Kind;

    Speech::Synthesis synth = services_.synthesis.synthesize(text, conversationId, epoch);
    if (synth.cancelled) return;
    LOG_DEBUG("Conversation", std::string("Speaking via ") + Speech::synthesisKindName(synth.kind));

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cycle != cycle_) return;

        try {
            services_.arbiter.configure(Audio::SessionMode::Playback);
        } catch (const VoiceError& e) {
            ErrorManager::report(e);
            setPhase(Phase::Error);
            return;
        }

        services_.speaker.rearm();
        services_.localVoice.rearm();
        if (synth.kind == Kind::Streaming) {
            services_.speaker.startStreaming(std::move(synth.stream));
        }
    }

    switch (synth.kind) {
        case Kind::Streaming: {
            bool natural = services_.speaker.waitForStreamEnd();
            LOG_DEBUG("Conversation", natural ? "Stream finished" : "Stream cancelled");
            return;
        }
        case Kind::Buffered:
            try {
                services_.speaker.playBuffered(synth.payload);
                return;
            } catch (const VoiceError& e) {
                ErrorManager::report(e);
            }
            playFallback(cycle, text);
            return;
        case Kind::Local:
            playFallback(cycle, text);
            return;
    }
}

bool VoiceConversation::playFallback(std::uint64_t cycle, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cycle != cycle_) return false;
    }
    // A stop after the check is latched and ends speak() at once
    return services_.localVoice.speak(text);
}

void VoiceConversation::finishSpeaking(std::uint64_t cycle) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (cycle != cycle_) return;

    if (options_.autoResume) {
        resumeListening();
        return;
    }
    services_.arbiter.release(Audio::SessionMode::Playback);
    setPhase(Phase::Listening);
}

} // namespace Conversation
