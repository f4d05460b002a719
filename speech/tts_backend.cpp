#include "tts_backend.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <string_view>

namespace Speech {

static const char* ELEVENLABS_URL = "https://api.elevenlabs.io/v1/text-to-speech/";
static const char* ELEVENLABS_MODEL = "eleven_monolingual_v1";

// Longest error body kept for logs
constexpr std::size_t MAX_ERROR_BODY = 512;

std::string joinUrl(const std::string& base, const std::string& path) {
    std::string trimmed = base;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    return trimmed + path;
}

static bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

// Throws NetworkFailure unless the response is a 2xx with a body
static std::vector<std::uint8_t> clipFrom(const cpr::Response& r, const std::string& what) {
    if (r.error.code != cpr::ErrorCode::OK) {
        throw VoiceError(ErrorKind::NetworkFailure, what + ": " + r.error.message);
    }
    if (!isSuccess(r.status_code)) {
        throw VoiceError(ErrorKind::NetworkFailure,
                         what + ": HTTP " + std::to_string(r.status_code) + " " +
                         r.text.substr(0, MAX_ERROR_BODY));
    }
    LOG_DEBUG("TTS", what + " returned " + std::to_string(r.text.size()) + " bytes");
    return std::vector<std::uint8_t>(r.text.begin(), r.text.end());
}

CprTtsBackend::CprTtsBackend(const VoiceSettings& settings)
    : baseUrl_(settings.backendUrl),
      voiceId_(settings.voiceId),
      elevenLabsKey_(settings.elevenLabsKey),
      requestTimeoutMs_(settings.requestTimeoutMs),
      resourceTimeoutMs_(settings.resourceTimeoutMs) {}

// =========================================================
// Buffered backend clip
// =========================================================
std::vector<std::uint8_t> CprTtsBackend::fetchClip(const std::string& text) {
    if (baseUrl_.empty()) {
        throw VoiceError(ErrorKind::NetworkFailure, "Backend URL not configured");
    }

    auto r = cpr::Post(
        cpr::Url{ joinUrl(baseUrl_, "/api/tts") },
        cpr::Header{{"Content-Type", "application/json"}, {"Accept", "audio/mpeg"}},
        cpr::Body{ nlohmann::json{{"text", text}, {"voice_id", voiceId_}}.dump() },
        cpr::ConnectTimeout{requestTimeoutMs_},
        cpr::Timeout{resourceTimeoutMs_}
    );
    return clipFrom(r, "Backend TTS");
}

// =========================================================
// Direct ElevenLabs clip
// =========================================================
std::vector<std::uint8_t> CprTtsBackend::fetchDirectClip(const std::string& text) {
    if (elevenLabsKey_.empty()) {
        throw VoiceError(ErrorKind::NetworkFailure, "ElevenLabs API key not configured");
    }

    nlohmann::json body = {
        {"text", text},
        {"model_id", ELEVENLABS_MODEL},
        {"voice_settings", {{"stability", 0.5}, {"similarity_boost", 0.75}}}
    };

    auto r = cpr::Post(
        cpr::Url{ std::string(ELEVENLABS_URL) + voiceId_ },
        cpr::Header{{"Content-Type", "application/json"},
                    {"Accept", "audio/mpeg"},
                    {"xi-api-key", elevenLabsKey_}},
        cpr::Body{ body.dump() },
        cpr::ConnectTimeout{requestTimeoutMs_},
        cpr::Timeout{resourceTimeoutMs_}
    );
    return clipFrom(r, "ElevenLabs TTS");
}

// =========================================================
// Streaming backend request
// =========================================================
std::unique_ptr<Net::StreamHandle> CprTtsBackend::openStream(
    const std::string& text, const std::optional<std::string>& conversationId) {
    if (baseUrl_.empty()) {
        throw VoiceError(ErrorKind::NetworkFailure, "Backend URL not configured");
    }

    nlohmann::json body = {{"message", text}, {"voice_id", voiceId_}};
    if (conversationId) body["conversation_id"] = *conversationId;

    std::string url = joinUrl(baseUrl_, "/api/tts/stream");
    std::string payload = body.dump();
    int connectMs = requestTimeoutMs_;
    int totalMs = resourceTimeoutMs_;

    auto producer = [url, payload, connectMs, totalMs](Net::ByteChannel& channel,
                                                       const std::atomic<bool>& cancelled) {
        long status = 0;
        std::string errorBody;

        auto onHeader = [&](std::string_view line, intptr_t) -> bool {
            // Status line of the (last) response: "HTTP/1.1 200 OK"
            if (line.rfind("HTTP/", 0) == 0) {
                auto sp = line.find(' ');
                if (sp != std::string_view::npos) {
                    status = std::strtol(std::string(line.substr(sp + 1, 3)).c_str(), nullptr, 10);
                }
            }
            return !cancelled;
        };

        auto onData = [&](std::string_view data, intptr_t) -> bool {
            if (cancelled) return false;
            if (!isSuccess(status)) {
                if (errorBody.size() < MAX_ERROR_BODY) errorBody.append(data.data(), data.size());
                return true;
            }
            return channel.push(std::string(data));
        };

        auto onProgress = [&](auto, auto, auto, auto, intptr_t) -> bool {
            return !cancelled;
        };

        LOG_DEBUG("TTS", "Opening stream " + url);
        auto r = cpr::Post(
            cpr::Url{url},
            cpr::Header{{"Content-Type", "application/json"}, {"Accept", "audio/pcm"}},
            cpr::Body{payload},
            cpr::HeaderCallback{onHeader},
            cpr::WriteCallback{onData},
            cpr::ProgressCallback{onProgress},
            cpr::ConnectTimeout{connectMs},
            cpr::Timeout{totalMs}
        );

        if (cancelled) return;
        if (r.error.code != cpr::ErrorCode::OK) {
            channel.fail("Stream request failed: " + r.error.message);
            return;
        }
        long finalStatus = r.status_code ? r.status_code : status;
        if (!isSuccess(finalStatus)) {
            channel.fail("Stream request: HTTP " + std::to_string(finalStatus) + " " + errorBody);
            return;
        }
        channel.close();
    };

    return std::make_unique<Net::StreamHandle>(std::move(producer));
}

} // namespace Speech
