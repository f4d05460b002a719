#include "audio_session.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <SFML/Audio/PlaybackDevice.hpp>

namespace Audio {

const char* modeName(SessionMode mode) {
    return mode == SessionMode::Record ? "record" : "playback";
}

static std::size_t slot(SessionMode mode) {
    return mode == SessionMode::Record ? 0 : 1;
}

// ============================================================
// DesktopSessionBackend
// ============================================================
DesktopSessionBackend::DesktopSessionBackend(int inputDeviceIndex, std::string outputDevice)
    : inputDeviceIndex_(inputDeviceIndex), outputDevice_(std::move(outputDevice)) {}

DesktopSessionBackend::~DesktopSessionBackend() {
    if (portAudioActive_) {
        Pa_Terminate();
        portAudioActive_ = false;
    }
}

void DesktopSessionBackend::checkInputDevice() const {
    int device = (inputDeviceIndex_ >= 0) ? inputDeviceIndex_ : Pa_GetDefaultInputDevice();
    if (device == paNoDevice || device < 0 || device >= Pa_GetDeviceCount()) {
        throw VoiceError(ErrorKind::ConfigurationFailure, "No valid input device found");
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels < 1) {
        throw VoiceError(ErrorKind::ConfigurationFailure,
                         "Device " + std::to_string(device) + " has no input channels");
    }
}

void DesktopSessionBackend::activate(SessionMode mode) {
    if (mode == SessionMode::Record) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            throw VoiceError(ErrorKind::ConfigurationFailure,
                             std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
        }
        portAudioActive_ = true;
        try {
            checkInputDevice();
        } catch (...) {
            Pa_Terminate();
            portAudioActive_ = false;
            throw;
        }
        return;
    }

    if (!outputDevice_.empty()) {
        if (!sf::PlaybackDevice::setDevice(outputDevice_)) {
            throw VoiceError(ErrorKind::ConfigurationFailure,
                             "Could not select playback device: " + outputDevice_);
        }
        return;
    }
    if (!sf::PlaybackDevice::getDefaultDevice()) {
        throw VoiceError(ErrorKind::ConfigurationFailure, "No playback device available");
    }
}

void DesktopSessionBackend::deactivate(SessionMode mode) {
    if (mode == SessionMode::Record && portAudioActive_) {
        Pa_Terminate();
        portAudioActive_ = false;
    }
    // Playback: SFML keeps its device; nothing scheduled survives the exit handler
}

void DesktopSessionBackend::verify(SessionMode mode) {
    if (mode == SessionMode::Record) {
        checkInputDevice();
    } else if (sf::PlaybackDevice::getAvailableDevices().empty()) {
        throw VoiceError(ErrorKind::ConfigurationFailure, "Playback device disappeared");
    }
}

// ============================================================
// SessionArbiter
// ============================================================
SessionArbiter::SessionArbiter(SessionBackend& backend) : backend_(backend) {}

void SessionArbiter::setExitHandler(SessionMode mode, std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(configureMutex_);
    exitHandlers_[slot(mode)] = std::move(handler);
}

namespace {

// Marks the calling thread as the switch owner for the scope of configure()
class SwitchOwner {
public:
    SwitchOwner(std::mutex& stateMutex, std::thread::id& owner)
        : stateMutex_(stateMutex), owner_(owner) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        owner_ = std::this_thread::get_id();
    }
    ~SwitchOwner() {
        std::lock_guard<std::mutex> lock(stateMutex_);
        owner_ = std::thread::id();
    }

private:
    std::mutex& stateMutex_;
    std::thread::id& owner_;
};

} // namespace

void SessionArbiter::configure(SessionMode mode) {
    std::lock_guard<std::mutex> switchLock(configureMutex_);
    SwitchOwner owner(stateMutex_, switchingThread_);

    std::optional<SessionMode> previous = activeMode();
    if (previous && *previous == mode) {
        try {
            backend_.verify(mode);
        } catch (const VoiceError&) {
            std::lock_guard<std::mutex> lock(stateMutex_);
            active_.reset();
            throw;
        }
        LOG_TRACE("AudioSession", std::string("Mode already active: ") + modeName(mode));
        return;
    }

    if (previous) {
        // Stop the other side before its configuration goes away
        auto& onExit = exitHandlers_[slot(*previous)];
        if (onExit) onExit();

        backend_.deactivate(*previous);
        std::lock_guard<std::mutex> lock(stateMutex_);
        active_.reset();
    }

    try {
        backend_.activate(mode);
    } catch (const VoiceError& e) {
        LOG_ERROR("AudioSession", std::string("Activate ") + modeName(mode) + " failed: " + e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("AudioSession", std::string("Activate ") + modeName(mode) + " failed: " + e.what());
        throw VoiceError(ErrorKind::ConfigurationFailure, e.what());
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    active_ = mode;
    ++switches_;
    LOG_DEBUG("AudioSession", std::string("Switched to ") + modeName(mode));
}

void SessionArbiter::release(SessionMode mode) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (switchingThread_ == std::this_thread::get_id()) {
            LOG_TRACE("AudioSession", std::string("Release of ") + modeName(mode) + " skipped, inside switch");
            return;
        }
    }
    // Not the owner here, so try_lock is well defined
    std::unique_lock<std::mutex> switchLock(configureMutex_, std::try_to_lock);
    if (!switchLock.owns_lock()) {
        LOG_TRACE("AudioSession", std::string("Release of ") + modeName(mode) + " skipped, switch in flight");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!active_ || *active_ != mode) return;
        active_.reset();
    }
    backend_.deactivate(mode);
    LOG_DEBUG("AudioSession", std::string("Released ") + modeName(mode));
}

std::optional<SessionMode> SessionArbiter::activeMode() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return active_;
}

std::size_t SessionArbiter::switchCount() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return switches_;
}

} // namespace Audio
