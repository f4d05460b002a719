#include "synthesis_client.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Speech {

const char* synthesisKindName(Synthesis::Kind kind) {
    switch (kind) {
        case Synthesis::Kind::Buffered:  return "buffered";
        case Synthesis::Kind::Streaming: return "streaming";
        case Synthesis::Kind::Local:     return "local";
    }
    return "?";
}

SynthesisClient::SynthesisClient(TtsBackend& backend, Options options)
    : backend_(backend), options_(options) {}

std::uint64_t SynthesisClient::epoch() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return epoch_;
}

bool SynthesisClient::isCancelled(std::uint64_t epoch) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return epoch != epoch_;
}

void SynthesisClient::cancel() {
    std::lock_guard<std::mutex> lock(mtx_);
    ++epoch_;
    // Wakes waitFirstByte(); the waiting call tears its handle down
    for (auto* handle : pending_) handle->channel().cancel();
    if (!pending_.empty()) LOG_DEBUG("Synthesis", "Pending stream cancelled");
}

bool SynthesisClient::tryStream(const std::string& text,
                                const std::optional<std::string>& conversationId,
                                std::uint64_t epoch, Synthesis& out) {
    std::unique_ptr<Net::StreamHandle> handle;
    try {
        handle = backend_.openStream(text, conversationId);
    } catch (const VoiceError& e) {
        LOG_ERROR("Synthesis", std::string("Stream open failed: ") + e.what());
        return false;
    }
    if (!handle) return false;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (epoch != epoch_) {
            handle->cancel();
            out.cancelled = true;
            return false;
        }
        pending_.push_back(handle.get());
    }

    bool firstByte = handle->channel().waitFirstByte(options_.firstByteTimeout);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.erase(std::remove(pending_.begin(), pending_.end(), handle.get()), pending_.end());
        if (epoch != epoch_) {
            out.cancelled = true;
            firstByte = false;
        }
    }
    if (out.cancelled) {
        handle->cancel();
        return false;
    }

    // Anything short of a first byte counts as a remote failure
    if (!firstByte) {
        std::string reason = handle->channel().error();
        if (reason.empty()) reason = handle->channel().isFinished() ? "empty stream" : "first byte timeout";
        handle->cancel();
        LOG_ERROR("Synthesis", "Stream failed before first byte: " + reason);
        return false;
    }

    out.kind = Synthesis::Kind::Streaming;
    out.stream = std::move(handle);
    return true;
}

bool SynthesisClient::tryClip(const std::string& text, bool direct, Synthesis& out) {
    const char* source = direct ? "ElevenLabs" : "backend";
    try {
        auto payload = direct ? backend_.fetchDirectClip(text) : backend_.fetchClip(text);
        if (payload.empty()) {
            LOG_ERROR("Synthesis", std::string("Empty clip from ") + source);
            return false;
        }
        out.kind = Synthesis::Kind::Buffered;
        out.payload = std::move(payload);
        return true;
    } catch (const VoiceError& e) {
        LOG_ERROR("Synthesis", std::string("Clip from ") + source + " failed: " + e.what());
        return false;
    }
}

Synthesis SynthesisClient::synthesize(const std::string& text,
                                      const std::optional<std::string>& conversationId,
                                      std::optional<std::uint64_t> epoch) {
    const std::uint64_t scope = epoch ? *epoch : this->epoch();
    Synthesis result;

    auto cancelled = [&]() {
        if (!result.cancelled && !isCancelled(scope)) return false;
        LOG_DEBUG("Synthesis", "Synthesis cancelled");
        result = Synthesis{};
        result.cancelled = true;
        return true;
    };

    if (cancelled()) return result;

    if (backend_.hasBackend()) {
        bool ok = options_.streaming ? tryStream(text, conversationId, scope, result)
                                     : tryClip(text, false, result);
        if (ok) {
            LOG_DEBUG("Synthesis", std::string("Remote ") + synthesisKindName(result.kind) + " synthesis");
            return result;
        }
        if (cancelled()) return result;
    }

    if (backend_.hasDirectVoice() && tryClip(text, true, result)) {
        LOG_DEBUG("Synthesis", "Direct ElevenLabs synthesis");
        return result;
    }
    if (cancelled()) return result;

    LOG_DEBUG("Synthesis", "Falling back to local synthesis");
    result.kind = Synthesis::Kind::Local;
    return result;
}

} // namespace Speech
