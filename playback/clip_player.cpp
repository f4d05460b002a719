#include "clip_player.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <chrono>
#include <thread>

namespace Playback {

SfmlClipPlayer::SfmlClipPlayer() = default;

SfmlClipPlayer::~SfmlClipPlayer() {
    stop();
}

bool SfmlClipPlayer::play(const std::vector<std::uint8_t>& payload) {
    if (payload.empty()) {
        throw VoiceError(ErrorKind::DecodeFailure, "Empty audio payload");
    }

    auto buffer = std::make_unique<sf::SoundBuffer>();
    if (!buffer->loadFromMemory(payload.data(), payload.size())) {
        throw VoiceError(ErrorKind::DecodeFailure,
                         "Could not decode clip (" + std::to_string(payload.size()) + " bytes)");
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopRequested_) return false;
        buffer_ = std::move(buffer);
        sound_ = std::make_unique<sf::Sound>(*buffer_);
        sound_->setVolume(100.f);
        sound_->play();
        LOG_DEBUG("Playback", "Playing clip (duration=" +
                  std::to_string(buffer_->getDuration().asSeconds()) + "s)");
    }

    while (!stopRequested_) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!sound_ || sound_->getStatus() == sf::SoundSource::Status::Stopped) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (sound_) sound_->stop();
    sound_.reset();
    buffer_.reset();
    return !stopRequested_;
}

void SfmlClipPlayer::stop() {
    stopRequested_ = true;
    std::lock_guard<std::mutex> lock(mtx_);
    if (sound_) sound_->stop();
}

} // namespace Playback
