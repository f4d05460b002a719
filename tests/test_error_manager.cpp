#include <gtest/gtest.h>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"

class ErrorManagerTest : public ::testing::Test {
protected:
    void SetUp() override { ErrorManager::load(bootstrap_config::defaultErrors()); }
};

TEST_F(ErrorManagerTest, EveryKindHasMessages) {
    const ErrorKind kinds[] = {
        ErrorKind::CaptureUnavailable, ErrorKind::RecognitionFailure, ErrorKind::NetworkFailure,
        ErrorKind::DecodeFailure, ErrorKind::ConfigurationFailure, ErrorKind::NoSpeech};

    for (ErrorKind kind : kinds) {
        std::string code = errorCode(kind);
        EXPECT_EQ(ErrorManager::getUserMessage(code).find("Unknown error code"), std::string::npos) << code;
        EXPECT_EQ(ErrorManager::getDebugMessage(code).find("No debug message"), std::string::npos) << code;
    }
}

TEST_F(ErrorManagerTest, ReportBuildsNotice) {
    Notice n = ErrorManager::report(VoiceError(ErrorKind::NetworkFailure, "HTTP 502"));

    EXPECT_EQ(n.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(n.code, "ERR_NETWORK_FAILURE");
    EXPECT_EQ(n.message, "[Chat] Failed to send message.");
    EXPECT_EQ(n.detail, "HTTP 502");
}

TEST_F(ErrorManagerTest, NoSpeechNotice) {
    Notice n = ErrorManager::report(ErrorKind::NoSpeech);
    EXPECT_EQ(n.code, "ERR_VOICE_NO_SPEECH");
    EXPECT_EQ(n.message, "No speech detected");
    EXPECT_TRUE(n.detail.empty());
}

TEST_F(ErrorManagerTest, UnknownCodesFallBack) {
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_NOPE"), "[Error] Unknown error code: ERR_NOPE");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_NOPE"), "[Debug] No debug message for code: ERR_NOPE");
}

TEST_F(ErrorManagerTest, AcceptsNestedErrorsDocument) {
    nlohmann::json doc = {{"errors", {{"ERR_NETWORK_FAILURE", {{"user", "offline"}, {"debug", "d"}}}}}};
    ErrorManager::load(doc);
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_NETWORK_FAILURE"), "offline");
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_VOICE_NO_SPEECH"),
              "[Error] Unknown error code: ERR_VOICE_NO_SPEECH");
}

TEST(ErrorKinds, NamesAndCodes) {
    EXPECT_STREQ(errorKindName(ErrorKind::DecodeFailure), "DecodeFailure");
    EXPECT_STREQ(errorCode(ErrorKind::ConfigurationFailure), "ERR_AUDIO_SESSION_CONFIG");

    VoiceError e(ErrorKind::CaptureUnavailable, "busy");
    EXPECT_STREQ(e.code(), "ERR_CAPTURE_UNAVAILABLE");
    EXPECT_STREQ(e.what(), "busy");
}
