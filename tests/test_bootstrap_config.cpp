#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "bootstrap_config.hpp"

using nlohmann::json;
namespace fs = std::filesystem;

TEST(MergeDefaults, FillsMissingKeysRecursively) {
    json cfg = {{"backend_url", "http://127.0.0.1:8000"}, {"whisper", {{"model", "ggml-small.bin"}}}};
    int patched = 0;

    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoice(), &patched));
    EXPECT_GT(patched, 0);
    EXPECT_EQ(cfg["backend_url"], "http://127.0.0.1:8000");
    EXPECT_EQ(cfg["whisper"]["model"], "ggml-small.bin");
    EXPECT_EQ(cfg["whisper"]["threads"], 4);
    EXPECT_EQ(cfg["quiescence_ms"], 600);
}

TEST(MergeDefaults, CompleteConfigIsUntouched) {
    json cfg = bootstrap_config::defaultVoice();
    int patched = 0;
    EXPECT_FALSE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoice(), &patched));
    EXPECT_EQ(patched, 0);
}

TEST(MergeDefaults, NumberSpellingsAreInterchangeable) {
    json cfg = bootstrap_config::defaultVoice();
    cfg["level_meter"]["rate_hz"] = 12.5;
    cfg["level_meter"]["min_delta"] = 0;

    EXPECT_FALSE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoice()));
    EXPECT_DOUBLE_EQ(cfg["level_meter"]["rate_hz"].get<double>(), 12.5);
}

TEST(MergeDefaults, WrongTypesAreReplaced) {
    json cfg = bootstrap_config::defaultVoice();
    cfg["streaming"] = "yes";
    cfg["capture"] = 3;
    int patched = 0;

    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoice(), &patched));
    EXPECT_EQ(patched, 2);
    EXPECT_EQ(cfg["streaming"], true);
    EXPECT_EQ(cfg["capture"]["sample_rate"], 16000);
}

TEST(SettingsFrom, DefaultsMatchTypedDefaults) {
    VoiceSettings s = bootstrap_config::settingsFrom(bootstrap_config::defaultVoice());
    VoiceSettings d;

    EXPECT_EQ(s.backendUrl, d.backendUrl);
    EXPECT_EQ(s.streamSampleRate, 24000u);
    EXPECT_EQ(s.quiescenceMs, 600);
    EXPECT_TRUE(s.streaming);
    EXPECT_TRUE(s.autoResume);
    EXPECT_EQ(s.finalWaitMs, 2500);
    EXPECT_DOUBLE_EQ(s.capture.sampleRate, 16000.0);
    EXPECT_EQ(s.whisper.model, d.whisper.model);
    EXPECT_EQ(s.localTtsCommand, (std::vector<std::string>{"espeak-ng"}));
    EXPECT_TRUE(s.elevenLabsKey.empty());
}

TEST(SettingsFrom, ReadsOverrides) {
    json cfg = bootstrap_config::defaultVoice();
    cfg["backend_url"] = "http://localhost:9000/";
    cfg["streaming"] = false;
    cfg["auto_resume"] = false;
    cfg["final_wait_ms"] = 800;
    cfg["capture"]["input_device_index"] = 2;
    cfg["playback"]["output_device"] = "USB Speakers";
    cfg["local_tts"]["command"] = json::array({"say", "-v", "Alex"});
    cfg["api_keys"]["elevenlabs"] = "sk-test";

    VoiceSettings s = bootstrap_config::settingsFrom(cfg);
    EXPECT_EQ(s.backendUrl, "http://localhost:9000/");
    EXPECT_FALSE(s.streaming);
    EXPECT_FALSE(s.autoResume);
    EXPECT_EQ(s.finalWaitMs, 800);
    EXPECT_EQ(s.capture.inputDeviceIndex, 2);
    EXPECT_EQ(s.outputDevice, "USB Speakers");
    EXPECT_EQ(s.localTtsCommand, (std::vector<std::string>{"say", "-v", "Alex"}));
    EXPECT_EQ(s.elevenLabsKey, "sk-test");
}

TEST(SettingsFrom, SingleStringCommand) {
    json cfg = bootstrap_config::defaultVoice();
    cfg["local_tts"]["command"] = "festival";
    EXPECT_EQ(bootstrap_config::settingsFrom(cfg).localTtsCommand,
              (std::vector<std::string>{"festival"}));
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("comprehend_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
        path = dir / "voice_config.json";
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    fs::path path;
};

TEST_F(LoadConfigTest, MissingFileIsCreatedFromDefaults) {
    json out;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoice(), out, "Voice config"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(out, bootstrap_config::defaultVoice());
}

TEST_F(LoadConfigTest, PartialFileIsPatchedAndSaved) {
    std::ofstream(path) << R"({"backend_url": "http://127.0.0.1:8000"})";

    json out;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoice(), out, "Voice config"));
    EXPECT_EQ(out["backend_url"], "http://127.0.0.1:8000");
    EXPECT_EQ(out["stream_sample_rate"], 24000);

    json saved;
    std::ifstream(path) >> saved;
    EXPECT_EQ(saved, out);
}

TEST_F(LoadConfigTest, InvalidFileIsResetToDefaults) {
    std::ofstream(path) << "{ not json";

    json out;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoice(), out,
                                              "Voice config", "ERR_CONFIG_INVALID"));
    EXPECT_EQ(out, bootstrap_config::defaultVoice());
}
