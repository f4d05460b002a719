#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "audio/audio_session.hpp"
#include "clip_player.hpp"
#include "net/stream_handle.hpp"
#include "stream_output.hpp"

namespace Playback {

/// Speaker
/// Buffered clips and streamed PCM on the playback side of the arbiter.
///
/// A stream is consumed on its own decoder thread: chunks are reassembled
/// into whole int16 frames, normalized and scheduled without waiting for
/// the device. When the stream completes a quiescence timer is armed; once
/// it expires with the output drained the output graph is torn down and
/// Playback is released. A new stream before that disarms the timer and
/// keeps the output running.
class Speaker {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        unsigned sampleRate = 24000;
        std::chrono::milliseconds quiescence{600};
    };

    Speaker(ClipPlayer& clips, StreamOutput& output, Audio::SessionArbiter& arbiter, Options options);
    ~Speaker();

    Speaker(const Speaker&) = delete;
    Speaker& operator=(const Speaker&) = delete;

    // Blocks until the clip ends; false if stopAll() cut it short.
    // Throws VoiceError(DecodeFailure) on empty or undecodable data.
    bool playBuffered(const std::vector<std::uint8_t>& payload);

    // Takes ownership; a stream still being received is cancelled first
    void startStreaming(std::unique_ptr<Net::StreamHandle> source);

    // Producer stopped, residual dropped, output idle. Safe to repeat.
    void cancelStreaming();

    // Blocks until the current stream is torn down. true = ended naturally.
    bool waitForStreamEnd();

    void stopAll();

    // Clear a latched stop before the next buffered clip
    void rearm() { clips_.rearm(); }

    bool isSpeaking() const;

    // Fires on the decoder thread when a stream's first chunk arrives
    void setFirstAudioCallback(std::function<void()> cb);

private:
    void consume(std::uint64_t generation, Net::ByteChannel& channel);
    void finishStream(std::uint64_t generation);
    void timerLoop();
    void retireStream(std::unique_ptr<Net::StreamHandle>& handle, std::thread& consumer);

    ClipPlayer& clips_;
    StreamOutput& output_;
    Audio::SessionArbiter& arbiter_;
    Options options_;

    // Held across start / cancel / teardown; taken before mtx_
    std::mutex controlMutex_;
    std::unique_ptr<Net::StreamHandle> handle_;
    std::thread consumer_;

    mutable std::mutex mtx_;
    std::condition_variable timerCv_;
    std::condition_variable endCv_;
    std::uint64_t generation_ = 0;
    bool engaged_ = false;
    bool natural_ = false;
    std::optional<Clock::time_point> deadline_;
    bool shutdown_ = false;

    std::atomic<bool> bufferedActive_{false};

    std::mutex callbackMutex_;
    std::function<void()> firstAudioCb_;

    std::thread timer_;
};

} // namespace Playback
