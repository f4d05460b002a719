#include "speaker.hpp"
#include "audio/pcm_reassembler.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

namespace Playback {

// Re-check interval while scheduled audio is still playing out
constexpr std::chrono::milliseconds DRAIN_POLL{50};
constexpr std::chrono::milliseconds CHANNEL_POLL{100};

Speaker::Speaker(ClipPlayer& clips, StreamOutput& output, Audio::SessionArbiter& arbiter, Options options)
    : clips_(clips), output_(output), arbiter_(arbiter), options_(options) {
    timer_ = std::thread([this]() { timerLoop(); });
}

Speaker::~Speaker() {
    cancelStreaming();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shutdown_ = true;
        timerCv_.notify_all();
    }
    if (timer_.joinable()) timer_.join();
}

void Speaker::setFirstAudioCallback(std::function<void()> cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    firstAudioCb_ = std::move(cb);
}

bool Speaker::isSpeaking() const {
    if (bufferedActive_) return true;
    std::lock_guard<std::mutex> lock(mtx_);
    return engaged_;
}

// ============================================================
// Buffered clips
// ============================================================
bool Speaker::playBuffered(const std::vector<std::uint8_t>& payload) {
    bufferedActive_ = true;
    bool completed = false;
    try {
        completed = clips_.play(payload);
    } catch (const VoiceError&) {
        bufferedActive_ = false;
        throw;
    }
    bufferedActive_ = false;
    arbiter_.release(Audio::SessionMode::Playback);
    LOG_DEBUG("Playback", completed ? "Clip finished" : "Clip stopped");
    return completed;
}

// ============================================================
// Streaming
// ============================================================
void Speaker::retireStream(std::unique_ptr<Net::StreamHandle>& handle, std::thread& consumer) {
    if (handle) handle->cancel();
    if (consumer.joinable()) consumer.join();
    handle.reset();
}

void Speaker::startStreaming(std::unique_ptr<Net::StreamHandle> source) {
    if (!source) return;
    std::lock_guard<std::mutex> control(controlMutex_);

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        generation = ++generation_;
        deadline_.reset();
        engaged_ = true;
        natural_ = false;
    }
    // Previous decoder sees a stale generation from here on
    retireStream(handle_, consumer_);

    handle_ = std::move(source);
    Net::ByteChannel& channel = handle_->channel();
    consumer_ = std::thread([this, generation, &channel]() { consume(generation, channel); });
    LOG_DEBUG("Playback", "Stream " + std::to_string(generation) + " started");
}

void Speaker::cancelStreaming() {
    std::lock_guard<std::mutex> control(controlMutex_);
    bool wasEngaged = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++generation_;
        deadline_.reset();
        wasEngaged = engaged_;
        engaged_ = false;
        natural_ = false;
        endCv_.notify_all();
    }

    retireStream(handle_, consumer_);
    output_.stop();
    if (wasEngaged) {
        arbiter_.release(Audio::SessionMode::Playback);
        LOG_DEBUG("Playback", "Stream cancelled");
    }
}

bool Speaker::waitForStreamEnd() {
    std::unique_lock<std::mutex> lock(mtx_);
    endCv_.wait(lock, [&]{ return !engaged_; });
    return natural_;
}

void Speaker::stopAll() {
    clips_.stop();
    cancelStreaming();
}

// Decoder thread: one per stream
void Speaker::consume(std::uint64_t generation, Net::ByteChannel& channel) {
    Audio::PcmReassembler reassembler;
    std::vector<float> frame;
    bool first = true;

    while (true) {
        std::string chunk;
        auto status = channel.pop(chunk, CHANNEL_POLL);

        if (status == Net::ByteChannel::Status::Timeout) continue;
        if (status == Net::ByteChannel::Status::Cancelled) return;

        if (status == Net::ByteChannel::Status::Chunk) {
            frame.clear();
            reassembler.feed(reinterpret_cast<const std::uint8_t*>(chunk.data()), chunk.size(), frame);

            if (first) {
                first = false;
                output_.start(options_.sampleRate);
                std::function<void()> cb;
                {
                    std::lock_guard<std::mutex> lock(callbackMutex_);
                    cb = firstAudioCb_;
                }
                if (cb) cb();
            }
            if (!frame.empty()) output_.schedule(frame.data(), frame.size());
            continue;
        }

        if (status == Net::ByteChannel::Status::Failed) {
            LOG_ERROR("Playback", "Stream failed mid-flight: " + channel.error());
        }
        if (reassembler.flush()) {
            LOG_DEBUG("Playback", "Dropped dangling PCM byte at end of stream");
        }
        finishStream(generation);
        return;
    }
}

void Speaker::finishStream(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (generation != generation_) return;
    deadline_ = Clock::now() + options_.quiescence;
    timerCv_.notify_all();
}

// ============================================================
// Quiescence timer
// ============================================================
void Speaker::timerLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!shutdown_) {
        if (!deadline_) {
            timerCv_.wait(lock);
            continue;
        }
        auto deadline = *deadline_;
        if (timerCv_.wait_until(lock, deadline) != std::cv_status::timeout) continue;
        if (!deadline_ || *deadline_ != deadline) continue;

        if (!output_.drained()) {
            deadline_ = Clock::now() + DRAIN_POLL;
            continue;
        }

        // Teardown under the control lock; recheck after reacquiring
        std::uint64_t generation = generation_;
        lock.unlock();
        std::unique_lock<std::mutex> control(controlMutex_);
        lock.lock();
        if (shutdown_ || generation != generation_ || !deadline_ || *deadline_ != deadline) {
            continue;
        }
        deadline_.reset();
        lock.unlock();

        retireStream(handle_, consumer_);
        output_.stop();
        arbiter_.release(Audio::SessionMode::Playback);
        LOG_DEBUG("Playback", "Quiescent, output torn down");

        lock.lock();
        engaged_ = false;
        natural_ = true;
        endCv_.notify_all();
    }
}

} // namespace Playback
