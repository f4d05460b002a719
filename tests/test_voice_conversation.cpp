#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "bootstrap_config.hpp"
#include "conversation/voice_conversation.hpp"
#include "fakes.hpp"

using Audio::SessionMode;
using Conversation::Phase;
using Conversation::VoiceConversation;
using Mode = fakes::FakeTtsBackend::StreamMode;
using namespace std::chrono_literals;

using Phases = std::vector<Phase>;

// Collects events from whichever thread fires them
struct Recorder {
    void phase(Phase p) {
        std::lock_guard<std::mutex> lock(mtx);
        phases.push_back(p);
    }
    void notice(const Notice& n) {
        std::lock_guard<std::mutex> lock(mtx);
        notices.push_back(n);
    }
    Phases phaseLog() {
        std::lock_guard<std::mutex> lock(mtx);
        return phases;
    }
    std::vector<Notice> noticeLog() {
        std::lock_guard<std::mutex> lock(mtx);
        return notices;
    }

    std::mutex mtx;
    Phases phases;
    std::vector<Notice> notices;
    std::vector<std::string> handoffs;
    std::vector<std::string> replies;
    std::atomic<int> firstAudio{0};
};

class VoiceConversationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::load(bootstrap_config::defaultErrors());
    }

    void start(bool autoResume = true, bool streaming = true) {
        Speech::SynthesisClient::Options synthOptions;
        synthOptions.streaming = streaming;
        synthOptions.firstByteTimeout = 2000ms;
        synthesis = std::make_unique<Speech::SynthesisClient>(tts, synthOptions);

        Conversation::Events events;
        events.onPhaseChanged = [this](Phase p) { rec.phase(p); };
        events.onNotice = [this](const Notice& n) { rec.notice(n); };
        events.onFirstAudio = [this]() { ++rec.firstAudio; };
        events.onReply = [this](const Chat::Reply& r) { rec.replies.push_back(r.content); };
        events.onTranscriptHandoff = [this](const std::string& t) { rec.handoffs.push_back(t); };

        // Final pass arrives shortly after end-of-audio, as with whisper
        recognizer.completeOnEnd = true;

        VoiceConversation::Options options;
        options.autoResume = autoResume;
        options.finalWait = 1000ms;
        conv = std::make_unique<VoiceConversation>(
            Conversation::Services{capture, arbiter, speaker, *synthesis, local, chat},
            options, events);
        conv->onEnterVoiceMode();
    }

    // A full turn has run once the machine is back in Listening
    bool turnDone(std::size_t minEvents = 2) {
        return fakes::waitFor([&]{
            auto log = rec.phaseLog();
            return log.size() >= minEvents && log.back() == Phase::Listening;
        });
    }

    void say(const std::string& text) {
        recognizer.hypothesis(text);
        ASSERT_TRUE(capture.hasTranscript());
    }

    Recorder rec;
    fakes::FakeSessionBackend backend;
    Audio::SessionArbiter arbiter{backend};
    fakes::FakeInput input;
    fakes::FakeRecognizer recognizer;
    Voice::CaptureEngine capture{input, recognizer};
    fakes::FakeClipPlayer clips;
    fakes::FakeStreamOutput output;
    Playback::Speaker speaker{clips, output, arbiter, Playback::Speaker::Options{24000, 20ms}};
    fakes::FakeTtsBackend tts;
    std::unique_ptr<Speech::SynthesisClient> synthesis;
    fakes::FakeLocalSynth local;
    fakes::FakeChat chat;
    std::unique_ptr<VoiceConversation> conv;   // destroyed first
};

TEST_F(VoiceConversationTest, EnteringStartsCapture) {
    start();

    EXPECT_TRUE(conv->inVoiceMode());
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(arbiter.activeMode() == SessionMode::Record);

    say("hello");
    auto s = conv->snapshot();
    EXPECT_TRUE(s.isRecording);
    EXPECT_TRUE(s.hasTranscript);
    EXPECT_FALSE(s.isSpeaking);
}

TEST_F(VoiceConversationTest, EnterSurvivesUnavailableRecognizer) {
    recognizer.available = false;
    start();

    EXPECT_TRUE(conv->inVoiceMode());
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_FALSE(capture.isCapturing());
}

TEST_F(VoiceConversationTest, SendWithoutSpeechShowsNotice) {
    start();
    conv->onSendTapped();

    auto notices = rec.noticeLog();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, ErrorKind::NoSpeech);
    EXPECT_EQ(notices[0].message, "No speech detected");
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(chat.messages().empty());
    EXPECT_TRUE(rec.phaseLog().empty());
}

TEST_F(VoiceConversationTest, StreamedTurnReturnsToListening) {
    start();
    say("what's the weather");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_EQ(rec.phaseLog(),
              (Phases{Phase::Finalizing, Phase::Sending, Phase::Speaking, Phase::Listening}));
    EXPECT_EQ(chat.messages(), (std::vector<std::string>{"what's the weather"}));
    EXPECT_EQ(rec.replies, (std::vector<std::string>{"Hello there"}));
    EXPECT_EQ(rec.firstAudio, 1);
    EXPECT_EQ(output.scheduled().size(), 2u);
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_EQ(input.starts, 2);
    EXPECT_TRUE(arbiter.activeMode() == SessionMode::Record);
    ASSERT_TRUE(conv->conversationId().has_value());
    EXPECT_EQ(*conv->conversationId(), "conv-1");
}

TEST_F(VoiceConversationTest, ConversationIdCarriesIntoNextTurn) {
    start();
    say("first");
    conv->onSendTapped();
    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    chat.reply = Chat::Reply{"Second answer", std::nullopt};
    say("second");
    conv->onSendTapped();
    ASSERT_TRUE(turnDone(8));
    conv->waitForPipeline();

    ASSERT_TRUE(tts.lastConversationId.has_value());
    EXPECT_EQ(*tts.lastConversationId, "conv-1");
    EXPECT_EQ(tts.streamRequests, (std::vector<std::string>{"Hello there", "Second answer"}));
}

TEST_F(VoiceConversationTest, FailedSendNotifiesAndResumesCapture) {
    chat.fail = true;
    start();
    say("are you there");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_EQ(rec.phaseLog(),
              (Phases{Phase::Finalizing, Phase::Sending, Phase::Error, Phase::Listening}));
    auto notices = rec.noticeLog();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(notices[0].message, "[Chat] Failed to send message.");
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(tts.streamRequests.empty());
}

TEST_F(VoiceConversationTest, TriggersAreIgnoredWhileSending) {
    fakes::Gate gate;
    chat.hold = &gate;
    start();
    say("hold on");
    conv->onSendTapped();
    ASSERT_TRUE(fakes::waitFor([&]{ return conv->phase() == Phase::Sending; }));

    conv->onSendTapped();
    conv->onInterruptTapped();
    EXPECT_EQ(conv->phase(), Phase::Sending);

    gate.open();
    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();
    EXPECT_EQ(chat.messages().size(), 1u);
}

TEST_F(VoiceConversationTest, InterruptStopsLocalSpeech) {
    tts.backend = false;
    local.blockUntilStopped = true;
    start();
    say("tell me a story");
    conv->onSendTapped();

    ASSERT_TRUE(fakes::waitFor([&]{ return local.isSpeaking(); }));
    EXPECT_EQ(conv->phase(), Phase::Speaking);
    EXPECT_TRUE(conv->snapshot().isSpeaking);

    conv->onInterruptTapped();
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_TRUE(capture.isCapturing());

    conv->waitForPipeline();
    EXPECT_FALSE(local.isSpeaking());
    EXPECT_EQ(rec.phaseLog(),
              (Phases{Phase::Finalizing, Phase::Sending, Phase::Speaking, Phase::Listening}));
    EXPECT_EQ(input.starts, 2);
}

TEST_F(VoiceConversationTest, InterruptCancelsStream) {
    tts.streamMode = Mode::Endless;
    start();
    say("keep talking");
    conv->onSendTapped();

    ASSERT_TRUE(fakes::waitFor([&]{ return output.starts == 1; }));
    ASSERT_EQ(conv->phase(), Phase::Speaking);

    conv->onInterruptTapped();
    conv->waitForPipeline();

    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_FALSE(output.isRunning());
    EXPECT_FALSE(speaker.isSpeaking());
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(arbiter.activeMode() == SessionMode::Record);
}

TEST_F(VoiceConversationTest, WithoutAutoResumeCaptureWaitsForUser) {
    start(false, false);
    say("no resume");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_EQ(clips.plays, 1);
    EXPECT_FALSE(capture.isCapturing());
    EXPECT_FALSE(arbiter.activeMode().has_value());

    // Empty send while idle brings capture back
    conv->onSendTapped();
    EXPECT_EQ(rec.noticeLog().back().kind, ErrorKind::NoSpeech);
    EXPECT_TRUE(capture.isCapturing());
}

TEST_F(VoiceConversationTest, UndecodableClipFallsBackToLocalVoice) {
    tts.clip = {'b', 'a', 'd'};
    start(true, false);
    say("read it");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_EQ(local.spoken(), (std::vector<std::string>{"Hello there"}));
    EXPECT_TRUE(capture.isCapturing());
}

TEST_F(VoiceConversationTest, EmptyReplySkipsSynthesis) {
    chat.reply = Chat::Reply{"   ", std::nullopt};
    start();
    say("anything");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_TRUE(tts.streamRequests.empty());
    EXPECT_TRUE(local.spoken().empty());
    EXPECT_FALSE(conv->conversationId().has_value());
}

TEST_F(VoiceConversationTest, PlaybackConfigFailureReturnsToListening) {
    backend.failActivate = SessionMode::Playback;
    start();
    say("speak up");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(5));
    conv->waitForPipeline();

    EXPECT_EQ(rec.phaseLog(),
              (Phases{Phase::Finalizing, Phase::Sending, Phase::Speaking, Phase::Error,
                      Phase::Listening}));
    EXPECT_EQ(output.starts, 0);
    EXPECT_TRUE(capture.isCapturing());
}

TEST_F(VoiceConversationTest, ExitHandsOffUnsentTranscript) {
    start();
    say("half a thought");
    conv->onExitVoiceMode();

    EXPECT_FALSE(conv->inVoiceMode());
    EXPECT_FALSE(capture.isCapturing());
    EXPECT_FALSE(arbiter.activeMode().has_value());
    EXPECT_EQ(rec.handoffs, (std::vector<std::string>{"half a thought"}));

    conv->onSendTapped();
    EXPECT_TRUE(chat.messages().empty());
}

TEST_F(VoiceConversationTest, ExitWhileSpeakingStopsEverything) {
    tts.backend = false;
    local.blockUntilStopped = true;
    start();
    say("long answer please");
    conv->onSendTapped();
    ASSERT_TRUE(fakes::waitFor([&]{ return local.isSpeaking(); }));

    conv->onExitVoiceMode();

    EXPECT_FALSE(local.isSpeaking());
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_FALSE(capture.isCapturing());
    EXPECT_FALSE(arbiter.activeMode().has_value());
    EXPECT_TRUE(rec.handoffs.empty());
}

TEST_F(VoiceConversationTest, FinalPassCompletesTranscriptBeforeSend) {
    recognizer.finalText = "what is entropy";
    start();
    say("what is");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    EXPECT_EQ(chat.messages(), (std::vector<std::string>{"what is entropy"}));
}

TEST_F(VoiceConversationTest, FinalPassThatEmptiesTranscriptIsNoSpeech) {
    recognizer.finalText = "   ";
    start();
    say("um");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(2));
    conv->waitForPipeline();

    EXPECT_EQ(rec.phaseLog(), (Phases{Phase::Finalizing, Phase::Listening}));
    auto notices = rec.noticeLog();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, ErrorKind::NoSpeech);
    EXPECT_TRUE(chat.messages().empty());
    EXPECT_TRUE(capture.isCapturing());
}

TEST_F(VoiceConversationTest, InterruptBeforeFirstByteCancelsSynthesis) {
    tts.streamMode = Mode::Silent;
    start();
    say("slow voice");
    conv->onSendTapped();

    ASSERT_TRUE(fakes::waitFor([&]{ return tts.openStreams.load() == 1; }));
    ASSERT_EQ(conv->phase(), Phase::Speaking);

    conv->onInterruptTapped();
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(fakes::waitFor([&]{ return tts.openStreams.load() == 0; }, 500ms));

    // The next turn does not pile a second request on top of the first
    say("again");
    conv->onSendTapped();
    ASSERT_TRUE(fakes::waitFor([&]{ return tts.openStreams.load() == 1; }));
    EXPECT_LE(tts.openStreams.load(), 1);

    auto begin = std::chrono::steady_clock::now();
    conv->onExitVoiceMode();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1000ms);
    EXPECT_EQ(tts.openStreams.load(), 0);
    EXPECT_TRUE(local.spoken().empty());
    EXPECT_EQ(output.starts, 0);
}

TEST_F(VoiceConversationTest, InterruptStopsBufferedClip) {
    clips.blockUntilStopped = true;
    start(true, false);
    say("play it");
    conv->onSendTapped();

    ASSERT_TRUE(fakes::waitFor([&]{ return clips.isPlaying(); }));
    ASSERT_EQ(conv->phase(), Phase::Speaking);

    conv->onInterruptTapped();
    EXPECT_EQ(conv->phase(), Phase::Listening);
    EXPECT_TRUE(capture.isCapturing());
    EXPECT_TRUE(arbiter.activeMode() == SessionMode::Record);

    conv->waitForPipeline();
    EXPECT_FALSE(clips.isPlaying());
    EXPECT_TRUE(local.spoken().empty());
    auto log = backend.log();
    EXPECT_NE(std::find(log.begin(), log.end(), "deactivate:playback"), log.end());
}

TEST_F(VoiceConversationTest, SplitSampleAcrossChunksIsReassembled) {
    tts.streamChunks = {std::string("\x00\x01\x02", 3), std::string("\x03", 1)};
    start();
    say("odd chunks");
    conv->onSendTapped();

    ASSERT_TRUE(turnDone(4));
    conv->waitForPipeline();

    auto samples = output.scheduled();
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 256 / 32768.0f);
    EXPECT_FLOAT_EQ(samples[1], 770 / 32768.0f);
    EXPECT_EQ(output.stops, 1);
}

TEST(PhaseNames, AreStable) {
    EXPECT_STREQ(Conversation::phaseName(Phase::Listening), "listening");
    EXPECT_STREQ(Conversation::phaseName(Phase::Error), "error");
}
