#pragma once
#include <string>
#include <vector>

// ------------------------------------------------------------
// Typed view of voice_config.json (built by bootstrap_config)
// ------------------------------------------------------------
struct CaptureSettings {
    int inputDeviceIndex = -1;          // -1 → PortAudio default input
    double sampleRate = 16000.0;        // whisper expects 16 kHz mono
    unsigned long framesPerBuffer = 512;
};

struct WhisperSettings {
    std::string model = "ggml-base.en.bin";
    std::string language = "en";
    int maxTokens = 0;                  // 0 → whisper default
    int threads = 4;
    int stepMs = 1000;                  // new audio needed before a re-run
    int windowMs = 15000;               // session audio kept for re-runs
};

struct LevelMeterSettings {
    double rateHz = 20.0;
    float minDelta = 0.03f;
};

struct VoiceSettings {
    std::string backendUrl;             // empty → backend disabled
    std::string voiceId = "21m00Tcm4TlvDq8ikWAM";
    bool streaming = true;
    unsigned streamSampleRate = 24000;
    int quiescenceMs = 600;
    bool autoResume = true;
    int finalWaitMs = 2500;             // send waits this long for the recognizer's final pass
    int requestTimeoutMs = 20000;
    int resourceTimeoutMs = 60000;
    std::string logLevel = "debug";

    CaptureSettings capture;
    WhisperSettings whisper;
    LevelMeterSettings levelMeter;

    std::string outputDevice;           // empty → SFML default device
    std::vector<std::string> localTtsCommand{"espeak-ng"};
    std::string elevenLabsKey;
};
