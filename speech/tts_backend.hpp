#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "net/stream_handle.hpp"
#include "settings.hpp"

namespace Speech {

// ------------------------------------------------------------
// TtsBackend: remote synthesis endpoints.
// Every call throws VoiceError(NetworkFailure) on transport errors
// and non-2xx replies.
// ------------------------------------------------------------
class TtsBackend {
public:
    virtual ~TtsBackend() = default;

    // Conversational backend configured (base URL set)
    virtual bool hasBackend() const = 0;

    // POST /api/tts, Accept: audio/mpeg
    virtual std::vector<std::uint8_t> fetchClip(const std::string& text) = 0;

    // POST /api/tts/stream, Accept: audio/pcm. The request runs on the
    // handle's producer thread; errors arrive through its channel.
    virtual std::unique_ptr<Net::StreamHandle> openStream(
        const std::string& text, const std::optional<std::string>& conversationId) = 0;

    // Direct ElevenLabs request (API key configured)
    virtual bool hasDirectVoice() const = 0;
    virtual std::vector<std::uint8_t> fetchDirectClip(const std::string& text) = 0;
};

/// CprTtsBackend
/// cpr transport for the backend and the ElevenLabs fallback. Every request
/// carries the configured connect (request) and total (resource) timeouts.
class CprTtsBackend : public TtsBackend {
public:
    explicit CprTtsBackend(const VoiceSettings& settings);

    bool hasBackend() const override { return !baseUrl_.empty(); }
    std::vector<std::uint8_t> fetchClip(const std::string& text) override;
    std::unique_ptr<Net::StreamHandle> openStream(
        const std::string& text, const std::optional<std::string>& conversationId) override;

    bool hasDirectVoice() const override { return !elevenLabsKey_.empty(); }
    std::vector<std::uint8_t> fetchDirectClip(const std::string& text) override;

private:
    std::string baseUrl_;
    std::string voiceId_;
    std::string elevenLabsKey_;
    int requestTimeoutMs_;
    int resourceTimeoutMs_;
};

// Base URL without trailing slashes + path
std::string joinUrl(const std::string& base, const std::string& path);

} // namespace Speech
