#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Audio {

enum class SessionMode { Record, Playback };

const char* modeName(SessionMode mode);

// ------------------------------------------------------------
// SessionBackend: the hardware side of a mode switch.
// activate() throws VoiceError(ConfigurationFailure) on failure.
// ------------------------------------------------------------
class SessionBackend {
public:
    virtual ~SessionBackend() = default;

    virtual void activate(SessionMode mode) = 0;
    virtual void deactivate(SessionMode mode) = 0;

    // Re-check an already active mode (device unplugged, ...)
    virtual void verify(SessionMode /*mode*/) {}
};

// PortAudio for the record side, SFML playback device for the output side
class DesktopSessionBackend : public SessionBackend {
public:
    DesktopSessionBackend(int inputDeviceIndex, std::string outputDevice);
    ~DesktopSessionBackend() override;

    void activate(SessionMode mode) override;
    void deactivate(SessionMode mode) override;
    void verify(SessionMode mode) override;

private:
    void checkInputDevice() const;

    int inputDeviceIndex_;
    std::string outputDevice_;
    bool portAudioActive_ = false;
};

/// SessionArbiter
/// Single serialized entry point for hardware configuration. A switch stops
/// the other side (exit handler), deactivates it, then activates the new
/// mode. Concurrent callers queue on the mutex; the last one wins.
class SessionArbiter {
public:
    explicit SessionArbiter(SessionBackend& backend);

    SessionArbiter(const SessionArbiter&) = delete;
    SessionArbiter& operator=(const SessionArbiter&) = delete;

    // Throws VoiceError(ConfigurationFailure); no mode is active afterwards
    void configure(SessionMode mode);

    // Give `mode` back. Skipped while a configure() call owns the switch,
    // including a release from inside that call's exit handler.
    void release(SessionMode mode);

    // Called (under the switch lock) before leaving `mode`
    void setExitHandler(SessionMode mode, std::function<void()> handler);

    std::optional<SessionMode> activeMode() const;
    std::size_t switchCount() const;

private:
    SessionBackend& backend_;
    std::mutex configureMutex_;
    mutable std::mutex stateMutex_;
    std::optional<SessionMode> active_;
    std::thread::id switchingThread_;      // set while configure() holds the switch
    std::function<void()> exitHandlers_[2];
    std::size_t switches_ = 0;
};

} // namespace Audio
