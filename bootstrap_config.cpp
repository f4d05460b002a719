#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

nlohmann::json voiceConfig = nlohmann::json::object();

// ----------------- helpers -----------------
static std::string envOrEmpty(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return "";
    std::string value = raw;
    auto start = value.find_first_not_of(" \t\r\n");
    auto end   = value.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return value.substr(start, end - start + 1);
}

namespace bootstrap_config {

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // int vs float spelling of the same setting is fine
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultVoice() {
    return {
        {"backend_url", ""},
        {"voice_id", "21m00Tcm4TlvDq8ikWAM"},
        {"streaming", true},
        {"stream_sample_rate", 24000},
        {"quiescence_ms", 600},
        {"auto_resume", true},
        {"final_wait_ms", 2500},
        {"request_timeout_ms", 20000},
        {"resource_timeout_ms", 60000},
        {"log_level", "debug"},

        {"capture", {
            {"input_device_index", -1},
            {"sample_rate", 16000},
            {"frames_per_buffer", 512}
        }},

        {"whisper", {
            {"model", "ggml-base.en.bin"},
            {"language", "en"},
            {"max_tokens", 0},
            {"threads", 4},
            {"step_ms", 1000},
            {"window_ms", 15000}
        }},

        {"level_meter", {
            {"rate_hz", 20},
            {"min_delta", 0.03}
        }},

        {"playback", {
            {"output_device", ""}
        }},

        {"local_tts", {
            {"command", nlohmann::json::array({"espeak-ng"})}
        }},

        {"api_keys", {
            {"elevenlabs", ""}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_CAPTURE_UNAVAILABLE", {
            {"user", "[Voice] Microphone is unavailable."},
            {"debug", "Capture could not start: permission, busy device or capture already active."}
        }},
        {"ERR_RECOGNITION_FAILURE", {
            {"user", "[Voice] Speech recognition failed."},
            {"debug", "Recognizer reported an error or produced no hypothesis."}
        }},
        {"ERR_NETWORK_FAILURE", {
            {"user", "[Chat] Failed to send message."},
            {"debug", "Chat or synthesis request failed (transport error or non-2xx)."}
        }},
        {"ERR_DECODE_FAILURE", {
            {"user", "[Audio] Could not play the reply."},
            {"debug", "Audio payload was empty or could not be decoded."}
        }},
        {"ERR_AUDIO_SESSION_CONFIG", {
            {"user", "[Audio] Audio device could not be configured."},
            {"debug", "Hardware session failed to switch between record and playback."}
        }},
        {"ERR_VOICE_NO_SPEECH", {
            {"user", "No speech detected"},
            {"debug", "Finalized transcript was empty; nothing sent."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "voice_config.json failed parsing or validation."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            LOG_ERROR("Config", errorCode + " -> " + ErrorManager::getDebugMessage(errorCode));

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- typed view -----------------
VoiceSettings settingsFrom(const nlohmann::json& cfg) {
    VoiceSettings s;
    s.backendUrl        = cfg.value("backend_url", s.backendUrl);
    s.voiceId           = cfg.value("voice_id", s.voiceId);
    s.streaming         = cfg.value("streaming", s.streaming);
    s.streamSampleRate  = cfg.value("stream_sample_rate", s.streamSampleRate);
    s.quiescenceMs      = cfg.value("quiescence_ms", s.quiescenceMs);
    s.autoResume        = cfg.value("auto_resume", s.autoResume);
    s.finalWaitMs       = cfg.value("final_wait_ms", s.finalWaitMs);
    s.requestTimeoutMs  = cfg.value("request_timeout_ms", s.requestTimeoutMs);
    s.resourceTimeoutMs = cfg.value("resource_timeout_ms", s.resourceTimeoutMs);
    s.logLevel          = cfg.value("log_level", s.logLevel);

    if (cfg.contains("capture")) {
        const auto& c = cfg["capture"];
        s.capture.inputDeviceIndex = c.value("input_device_index", s.capture.inputDeviceIndex);
        s.capture.sampleRate       = c.value("sample_rate", s.capture.sampleRate);
        s.capture.framesPerBuffer  = c.value("frames_per_buffer", s.capture.framesPerBuffer);
    }
    if (cfg.contains("whisper")) {
        const auto& w = cfg["whisper"];
        s.whisper.model     = w.value("model", s.whisper.model);
        s.whisper.language  = w.value("language", s.whisper.language);
        s.whisper.maxTokens = w.value("max_tokens", s.whisper.maxTokens);
        s.whisper.threads   = w.value("threads", s.whisper.threads);
        s.whisper.stepMs    = w.value("step_ms", s.whisper.stepMs);
        s.whisper.windowMs  = w.value("window_ms", s.whisper.windowMs);
    }
    if (cfg.contains("level_meter")) {
        const auto& l = cfg["level_meter"];
        s.levelMeter.rateHz   = l.value("rate_hz", s.levelMeter.rateHz);
        s.levelMeter.minDelta = l.value("min_delta", s.levelMeter.minDelta);
    }
    if (cfg.contains("playback")) {
        s.outputDevice = cfg["playback"].value("output_device", s.outputDevice);
    }
    if (cfg.contains("local_tts") && cfg["local_tts"].contains("command")) {
        const auto& cmd = cfg["local_tts"]["command"];
        if (cmd.is_array() && !cmd.empty()) {
            s.localTtsCommand.clear();
            for (const auto& part : cmd) s.localTtsCommand.push_back(part.get<std::string>());
        } else if (cmd.is_string()) {
            s.localTtsCommand = { cmd.get<std::string>() };
        }
    }
    if (cfg.contains("api_keys")) {
        s.elevenLabsKey = cfg["api_keys"].value("elevenlabs", s.elevenLabsKey);
    }
    return s;
}

// ----------------- entry -----------------
void initAll() {
    // errors.json first so config failures can be described
    fs::path errPath = fs::path(getResourcePath()) / "errors.json";
    nlohmann::json errorsCfg;
    std::error_code ec;
    fs::create_directories(errPath.parent_path(), ec);
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::load(errorsCfg);

    // voice_config.json
    fs::path cfgPath = fs::current_path() / VOICE_CONFIG_FILE;
    loadConfig(cfgPath, defaultVoice(), voiceConfig, "Voice config", "ERR_CONFIG_INVALID");

    // Environment wins over the file
    std::string envUrl = envOrEmpty("BACKEND_BASE_URL");
    if (!envUrl.empty()) {
        voiceConfig["backend_url"] = envUrl;
        LOG_DEBUG("Config", "backend_url overridden from environment: " + envUrl);
    }
    std::string envKey = envOrEmpty("ELEVENLABS_API_KEY");
    if (!envKey.empty()) {
        voiceConfig["api_keys"]["elevenlabs"] = envKey;
        LOG_DEBUG("Config", "ElevenLabs key taken from environment");
    }

    setLogLevel(parseLogLevel(voiceConfig.value("log_level", "debug")));
}

} // namespace bootstrap_config
