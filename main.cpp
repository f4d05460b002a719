#include "audio/audio_input.hpp"
#include "audio/audio_session.hpp"
#include "bootstrap.hpp"
#include "chat/chat_client.hpp"
#include "conversation/voice_conversation.hpp"
#include "device_setups/audio_devices.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "playback/clip_player.hpp"
#include "playback/speaker.hpp"
#include "playback/stream_output.hpp"
#include "speech/local_synth.hpp"
#include "speech/synthesis_client.hpp"
#include "speech/tts_backend.hpp"
#include "voice/capture_engine.hpp"
#include "voice/whisper_recognizer.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Event callbacks print from worker threads
static std::mutex g_consoleMutex;

static void consoleLine(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::cout << "\r" << text << "\n> " << std::flush;
}

static std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    auto end   = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static void printStatus(const Conversation::VoiceConversation& conversation) {
    auto s = conversation.snapshot();
    std::ostringstream oss;
    oss << "[Status] phase=" << Conversation::phaseName(s.phase)
        << " recording=" << (s.isRecording ? "yes" : "no")
        << " speaking=" << (s.isSpeaking ? "yes" : "no")
        << " transcript=" << (s.hasTranscript ? "yes" : "no")
        << " level=" << std::fixed << std::setprecision(2) << s.inputLevel;
    if (auto id = conversation.conversationId()) oss << " conversation=" << *id;

    PhaseInfo last = lastPhase();
    if (!last.phaseName.empty()) {
        std::time_t t = std::chrono::system_clock::to_time_t(last.timestamp);
        oss << "\n[Status] last phase: " << last.phaseName
            << (last.success ? " (ok" : " (failed") << ", "
            << std::put_time(std::localtime(&t), "%H:%M:%S") << ")";
    }
    consoleLine(oss.str());
}

// ============================================================
// Main entry point
// ============================================================
int main() {
    // Initialize logger (writes to comprehend.log + console)
    initLogger("comprehend.log");
    LOG_PHASE("Startup begin", true);

    // Bootstrap configuration and resources
    VoiceSettings settings = runBootstrapChecks();
    LOG_PHASE("Bootstrap checks complete", true);

    // ============================================================
    // Services
    // ============================================================
    Audio::DesktopSessionBackend sessionBackend(settings.capture.inputDeviceIndex, settings.outputDevice);
    Audio::SessionArbiter arbiter(sessionBackend);

    Audio::PortAudioInput micInput(settings.capture);
    Voice::WhisperRecognizer recognizer(settings.whisper, settings.capture.sampleRate);
    Voice::CaptureEngine capture(micInput, recognizer, settings.levelMeter);

    Playback::SfmlClipPlayer clipPlayer;
    Playback::SfmlStreamOutput streamOutput;
    Playback::Speaker::Options speakerOptions;
    speakerOptions.sampleRate = settings.streamSampleRate;
    speakerOptions.quiescence = std::chrono::milliseconds(settings.quiescenceMs);
    Playback::Speaker speaker(clipPlayer, streamOutput, arbiter, speakerOptions);

    Speech::CprTtsBackend ttsBackend(settings);
    Speech::SynthesisClient::Options synthOptions;
    synthOptions.streaming = settings.streaming;
    synthOptions.firstByteTimeout = std::chrono::milliseconds(settings.requestTimeoutMs);
    Speech::SynthesisClient synthesis(ttsBackend, synthOptions);
    Speech::ProcessSynthesizer localVoice(settings.localTtsCommand);

    Chat::BackendChatClient chat(settings);
    LOG_PHASE("Services constructed", true);

    // ============================================================
    // Presentation hooks (console)
    // ============================================================
    Conversation::Events events;
    events.onPhaseChanged = [](Conversation::Phase phase) {
        consoleLine(std::string("[Voice] ") + Conversation::phaseName(phase));
    };
    events.onNotice = [](const Notice& notice) {
        consoleLine(notice.message);
    };
    events.onFirstAudio = []() {
        consoleLine("[Voice] (audio started)");
    };
    events.onReply = [](const Chat::Reply& reply) {
        consoleLine("[AI] " + reply.content);
    };
    events.onTranscript = [](const std::string& transcript) {
        consoleLine("[You] " + transcript);
    };
    events.onTranscriptHandoff = [](const std::string& transcript) {
        consoleLine("[Draft] " + transcript);
    };

    Conversation::VoiceConversation::Options convOptions;
    convOptions.autoResume = settings.autoResume;
    convOptions.finalWait = std::chrono::milliseconds(settings.finalWaitMs);
    Conversation::VoiceConversation conversation(
        Conversation::Services{capture, arbiter, speaker, synthesis, localVoice, chat},
        convOptions, events);

    conversation.onEnterVoiceMode();
    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    consoleLine("Comprehend voice mode. Commands: send (or empty line), stop, status, devices, quit");
    std::string line;
    while (true) {
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        std::string cmd = toLower(trim(line));
        LOG_TRACE("Console", "Dispatching command: " + cmd);

        if (cmd.empty() || cmd == "send") {
            conversation.onSendTapped();
        } else if (cmd == "stop" || cmd == "interrupt") {
            conversation.onInterruptTapped();
        } else if (cmd == "status") {
            printStatus(conversation);
        } else if (cmd == "devices") {
            std::lock_guard<std::mutex> lock(g_consoleMutex);
            printAudioDevices(settings.capture.inputDeviceIndex, settings.outputDevice);
            std::cout << "> " << std::flush;
        } else if (cmd == "quit" || cmd == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        } else {
            consoleLine("Unknown command: " + cmd);
        }
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    conversation.onExitVoiceMode();
    conversation.waitForPipeline();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
