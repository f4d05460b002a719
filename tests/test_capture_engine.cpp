#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "fakes.hpp"
#include "voice/capture_engine.hpp"

using Voice::CaptureEngine;
using namespace std::chrono_literals;

class CaptureEngineTest : public ::testing::Test {
protected:
    fakes::FakeInput input;
    fakes::FakeRecognizer recognizer;
    CaptureEngine engine{input, recognizer};
};

TEST_F(CaptureEngineTest, HypothesesReplaceTranscript) {
    std::vector<std::string> seen;
    engine.setHypothesisCallback([&](const std::string& t) { seen.push_back(t); });

    engine.startCapture();
    EXPECT_TRUE(engine.isCapturing());
    EXPECT_FALSE(engine.hasTranscript());

    recognizer.hypothesis("turn the");
    recognizer.hypothesis("turn the lights");
    recognizer.hypothesis("turn the lights");   // unchanged, not re-published

    EXPECT_TRUE(engine.hasTranscript());
    EXPECT_EQ(seen, (std::vector<std::string>{"turn the", "turn the lights"}));
}

TEST_F(CaptureEngineTest, FinalizeTrimsAndClears) {
    engine.startCapture();
    recognizer.hypothesis("  what time is it \n");
    engine.stopCapture();

    EXPECT_EQ(engine.finalizeTranscript(), "what time is it");
    EXPECT_FALSE(engine.hasTranscript());
    EXPECT_EQ(engine.finalizeTranscript(), "");
}

TEST_F(CaptureEngineTest, WhitespaceOnlyIsNoTranscript) {
    engine.startCapture();
    recognizer.hypothesis("   ");
    EXPECT_FALSE(engine.hasTranscript());
}

TEST_F(CaptureEngineTest, SecondStartIsRejected) {
    engine.startCapture();
    try {
        engine.startCapture();
        FAIL() << "expected CaptureUnavailable";
    } catch (const VoiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CaptureUnavailable);
    }
    EXPECT_EQ(input.starts, 1);
    EXPECT_TRUE(engine.isCapturing());
}

TEST_F(CaptureEngineTest, UnavailableRecognizerRejectsStart) {
    recognizer.available = false;
    EXPECT_THROW(engine.startCapture(), VoiceError);
    EXPECT_EQ(input.starts, 0);
    EXPECT_FALSE(engine.isCapturing());
}

TEST_F(CaptureEngineTest, MicrophoneFailureCancelsSession) {
    input.failStart = true;
    try {
        engine.startCapture();
        FAIL() << "expected CaptureUnavailable";
    } catch (const VoiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CaptureUnavailable);
    }
    EXPECT_EQ(recognizer.cancels, 1);
    EXPECT_FALSE(engine.isCapturing());

    // Recoverable once the device frees up
    input.failStart = false;
    engine.startCapture();
    EXPECT_TRUE(engine.isCapturing());
}

TEST_F(CaptureEngineTest, FramesReachRecognizerAndMeter) {
    engine.startCapture();
    input.deliver(std::vector<float>(512, 0.02f));

    EXPECT_EQ(recognizer.samples, 512u);
    EXPECT_NEAR(engine.inputLevel(), 0.4f, 1e-3f);

    engine.stopCapture();
    EXPECT_FLOAT_EQ(engine.inputLevel(), 0.0f);
}

TEST_F(CaptureEngineTest, StopSignalsEndOfAudioAndKeepsTranscript) {
    engine.startCapture();
    recognizer.hypothesis("hello");
    engine.stopCapture();

    EXPECT_TRUE(recognizer.ended);
    EXPECT_FALSE(engine.isCapturing());
    EXPECT_EQ(input.stops, 1);

    // Final result after end-of-audio still lands
    recognizer.hypothesis("hello there");
    EXPECT_EQ(engine.finalizeTranscript(), "hello there");

    engine.stopCapture();   // idle: no-op
    EXPECT_EQ(input.stops, 1);
}

TEST_F(CaptureEngineTest, RecognizerCompletionStopsCapture) {
    engine.startCapture();
    recognizer.complete("set a timer");

    EXPECT_FALSE(engine.isCapturing());
    EXPECT_FALSE(input.isRunning());
    EXPECT_EQ(engine.finalizeTranscript(), "set a timer");
}

TEST_F(CaptureEngineTest, RecognizerErrorStopsCaptureAndReports) {
    std::vector<ErrorKind> failures;
    engine.setFailureCallback([&](const VoiceError& e) { failures.push_back(e.kind()); });

    engine.startCapture();
    recognizer.fail("model crashed");

    EXPECT_FALSE(engine.isCapturing());
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], ErrorKind::RecognitionFailure);
}

TEST_F(CaptureEngineTest, LateHypothesisAfterFinalizeIsDropped) {
    engine.startCapture();
    recognizer.hypothesis("send this");
    engine.stopCapture();
    ASSERT_EQ(engine.finalizeTranscript(), "send this");

    recognizer.hypothesis("send this please");
    EXPECT_FALSE(engine.hasTranscript());

    // A fresh session writes again
    engine.startCapture();
    recognizer.hypothesis("next one");
    EXPECT_EQ(engine.finalizeTranscript(), "next one");
}

TEST_F(CaptureEngineTest, FinalPassLandsBeforeFinalize) {
    recognizer.completeOnEnd = true;
    recognizer.finalText = "what is entropy";
    engine.startCapture();
    recognizer.hypothesis("what is");
    engine.stopCapture();

    EXPECT_TRUE(engine.waitForFinal(2000ms));
    EXPECT_EQ(engine.finalizeTranscript(), "what is entropy");
}

TEST_F(CaptureEngineTest, WaitForFinalTimesOutWithoutFinalPass) {
    engine.startCapture();
    recognizer.hypothesis("half a sentence");
    engine.stopCapture();

    EXPECT_FALSE(engine.waitForFinal(30ms));
    EXPECT_EQ(engine.finalizeTranscript(), "half a sentence");
}

TEST_F(CaptureEngineTest, RecognizerErrorEndsTheWait) {
    engine.startCapture();
    recognizer.hypothesis("partial");
    engine.stopCapture();
    recognizer.fail("model crashed");

    EXPECT_TRUE(engine.waitForFinal(30ms));
    EXPECT_EQ(engine.finalizeTranscript(), "partial");
}

TEST_F(CaptureEngineTest, NothingToWaitForAfterFinalize) {
    engine.startCapture();
    engine.stopCapture();
    engine.finalizeTranscript();
    EXPECT_TRUE(engine.waitForFinal(0ms));
}
