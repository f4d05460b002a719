#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "device_setups/audio_devices.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

VoiceSettings runBootstrapChecks() {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    bootstrap_config::initAll();
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    VoiceSettings settings = bootstrap_config::settingsFrom(voiceConfig);

    // ============================================================
    // Whisper model
    // ============================================================
    fs::path model = getModelPath(settings.whisper.model);
    if (fs::exists(model)) {
        LOG_PHASE("Whisper model found", true);
        LOG_DEBUG("Config", "Whisper model: " + model.string());
    } else {
        LOG_ERROR("Config", "Whisper model missing: " + model.string() + " (capture will be unavailable)");
        LOG_PHASE("Whisper model found", false);
    }

    // ============================================================
    // Playback devices
    // ============================================================
    auto outputs = getPlaybackDevices();
    LOG_DEBUG("Audio", "Playback devices: " + std::to_string(outputs.size()));
    LOG_PHASE("Playback device check", !outputs.empty());

    // ============================================================
    // Backend
    // ============================================================
    if (settings.backendUrl.empty()) {
        LOG_WARN("Config", "backend_url not set; chat requests will fail");
        LOG_PHASE("Backend configured", false);
    } else {
        LOG_DEBUG("Config", "Backend: " + settings.backendUrl +
                            (settings.streaming ? " (streaming TTS)" : " (buffered TTS)"));
        LOG_PHASE("Backend configured", true);
    }
    if (!settings.elevenLabsKey.empty()) {
        LOG_DEBUG("Config", "ElevenLabs fallback enabled");
    }

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return settings;
}
