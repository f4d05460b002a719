#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "settings.hpp"

inline constexpr const char* VOICE_CONFIG_FILE = "voice_config.json";

// Loaded voice configuration (voice_config.json, defaults patched in)
extern nlohmann::json voiceConfig;

// Centralized config bootstrap for Comprehend
namespace bootstrap_config {

    // Load voice_config.json + errors.json, apply environment overrides
    void initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Recursively fill missing / mistyped keys from defs; true if cfg changed
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultVoice();
    nlohmann::json defaultErrors();

    // Typed settings from a (merged) config document
    VoiceSettings settingsFrom(const nlohmann::json& cfg);
}
