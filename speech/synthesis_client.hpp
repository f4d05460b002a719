#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "net/stream_handle.hpp"
#include "tts_backend.hpp"

namespace Speech {

// What synthesize() produced; exactly one path is filled
struct Synthesis {
    enum class Kind { Buffered, Streaming, Local };

    Kind kind = Kind::Local;
    std::vector<std::uint8_t> payload;            // Buffered
    std::unique_ptr<Net::StreamHandle> stream;    // Streaming, first byte already seen
    bool cancelled = false;                       // cancel() cut the chain short
};

const char* synthesisKindName(Synthesis::Kind kind);

/// SynthesisClient
/// Remote first (stream or clip), then a direct ElevenLabs clip, then
/// local synthesis. Never throws for remote failures; they are logged and
/// the next link is tried.
///
/// cancel() aborts every synthesize() call of the current epoch, including
/// one still waiting for a stream's first byte and one that has not started
/// yet (the caller takes the epoch before it may be cancelled).
class SynthesisClient {
public:
    struct Options {
        bool streaming = true;
        std::chrono::milliseconds firstByteTimeout{20000};
    };

    SynthesisClient(TtsBackend& backend, Options options);

    // `epoch` defaults to the current one
    Synthesis synthesize(const std::string& text,
                         const std::optional<std::string>& conversationId = std::nullopt,
                         std::optional<std::uint64_t> epoch = std::nullopt);

    std::uint64_t epoch() const;
    void cancel();

private:
    bool tryStream(const std::string& text, const std::optional<std::string>& conversationId,
                   std::uint64_t epoch, Synthesis& out);
    bool tryClip(const std::string& text, bool direct, Synthesis& out);
    bool isCancelled(std::uint64_t epoch) const;

    TtsBackend& backend_;
    Options options_;

    mutable std::mutex mtx_;
    std::uint64_t epoch_ = 0;
    std::vector<Net::StreamHandle*> pending_;   // streams waiting for a first byte
};

} // namespace Speech
