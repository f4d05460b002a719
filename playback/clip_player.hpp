#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace sf {
class Sound;
class SoundBuffer;
}

namespace Playback {

// ------------------------------------------------------------
// ClipPlayer: one complete compressed clip, played to the end.
// play() blocks; throws VoiceError(DecodeFailure).
// stop() latches until rearm(), so a stop that lands before
// play() still cancels it.
// ------------------------------------------------------------
class ClipPlayer {
public:
    virtual ~ClipPlayer() = default;

    // Returns false when stop() cut the clip short
    virtual bool play(const std::vector<std::uint8_t>& payload) = 0;
    virtual void stop() = 0;
    virtual void rearm() = 0;
};

/// SfmlClipPlayer
/// Decodes through sf::SoundBuffer (mp3/ogg/wav/flac) and polls the
/// sf::Sound until it finishes or is stopped.
class SfmlClipPlayer : public ClipPlayer {
public:
    SfmlClipPlayer();
    ~SfmlClipPlayer() override;

    bool play(const std::vector<std::uint8_t>& payload) override;
    void stop() override;
    void rearm() override { stopRequested_ = false; }

private:
    std::mutex mtx_;
    std::unique_ptr<sf::SoundBuffer> buffer_;
    std::unique_ptr<sf::Sound> sound_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace Playback
