#include "capture_engine.hpp"
#include "logger.hpp"

namespace Voice {

static std::string trimCopy(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

CaptureEngine::CaptureEngine(Audio::InputDevice& input, Recognizer& recognizer,
                             const LevelMeterSettings& meter)
    : input_(input), recognizer_(recognizer), meter_(meter.rateHz, meter.minDelta) {}

CaptureEngine::~CaptureEngine() {
    {
        std::lock_guard<std::mutex> lock(deviceMutex_);
        ++captureSession_;
        if (capturing_) {
            input_.stop();
            capturing_ = false;
        }
    }
    recognizer_.cancel();
}

void CaptureEngine::setHypothesisCallback(HypothesisCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    hypothesisCb_ = std::move(cb);
}

void CaptureEngine::setFailureCallback(FailureCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    failureCb_ = std::move(cb);
}

// ============================================================
// Start / Stop
// ============================================================
void CaptureEngine::startCapture() {
    std::lock_guard<std::mutex> lock(deviceMutex_);

    if (capturing_) {
        throw VoiceError(ErrorKind::CaptureUnavailable, "Capture already active");
    }
    if (!recognizer_.isAvailable()) {
        throw VoiceError(ErrorKind::CaptureUnavailable, "Speech recognition unavailable");
    }

    const std::uint64_t session = ++captureSession_;
    {
        std::lock_guard<std::mutex> tlock(transcriptMutex_);
        transcriptSession_ = session;
    }
    meter_.reset();

    Recognizer::Callbacks callbacks;
    callbacks.onHypothesis = [this, session](const std::string& text) { onHypothesis(session, text); };
    callbacks.onComplete = [this, session](const std::string& text) {
        onHypothesis(session, text);
        markComplete(session);
        autoStop(session);
    };
    callbacks.onError = [this, session](const VoiceError& error) {
        markComplete(session);
        onFailure(session, error);
    };
    recognizer_.beginSession(std::move(callbacks));

    try {
        input_.start([this](const float* samples, std::size_t frames) { onFrames(samples, frames); });
    } catch (const VoiceError& e) {
        recognizer_.cancel();
        markComplete(session);
        LOG_ERROR("Capture", std::string("Mic start failed: ") + e.what());
        if (e.kind() == ErrorKind::CaptureUnavailable) throw;
        throw VoiceError(ErrorKind::CaptureUnavailable, e.what());
    }

    capturing_ = true;
    LOG_DEBUG("Capture", "Capture started (session " + std::to_string(session) + ")");
}

void CaptureEngine::stopCapture() {
    std::lock_guard<std::mutex> lock(deviceMutex_);
    if (!capturing_) return;

    input_.stop();
    capturing_ = false;
    meter_.reset();
    recognizer_.endAudio();
    LOG_DEBUG("Capture", "Capture stopped");
}

// Recognizer thread. A concurrent start/stop owns the device, so a busy
// lock means this stop is already superseded.
void CaptureEngine::autoStop(std::uint64_t session) {
    std::unique_lock<std::mutex> lock(deviceMutex_, std::try_to_lock);
    if (!lock.owns_lock()) return;
    if (session != captureSession_.load() || !capturing_) return;

    input_.stop();
    capturing_ = false;
    meter_.reset();
    LOG_DEBUG("Capture", "Recognition ended, capture auto-stopped");
}

// ============================================================
// Transcript
// ============================================================
bool CaptureEngine::waitForFinal(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(transcriptMutex_);
    const std::uint64_t session = transcriptSession_;
    if (session == 0) return true;

    bool done = finalCv_.wait_for(lock, timeout, [&]() {
        return completedSession_ >= session || transcriptSession_ != session;
    });
    if (!done) LOG_WARN("Capture", "No final pass within " + std::to_string(timeout.count()) + " ms");
    return done;
}

std::string CaptureEngine::finalizeTranscript() {
    std::string taken;
    {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        taken.swap(transcript_);
        // Anything the session says from here on is dropped
        transcriptSession_ = 0;
    }
    finalCv_.notify_all();
    return trimCopy(taken);
}

void CaptureEngine::markComplete(std::uint64_t session) {
    {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        if (session > completedSession_) completedSession_ = session;
    }
    finalCv_.notify_all();
}

bool CaptureEngine::hasTranscript() const {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    return transcript_.find_first_not_of(" \t\n\r") != std::string::npos;
}

// ============================================================
// Callbacks
// ============================================================
void CaptureEngine::onFrames(const float* samples, std::size_t frames) {
    meter_.update(samples, frames);
    recognizer_.appendAudio(samples, frames);
}

void CaptureEngine::onHypothesis(std::uint64_t session, const std::string& text) {
    std::string copy;
    {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        if (session != transcriptSession_) return;
        if (transcript_ == text) return;
        transcript_ = text;
        copy = transcript_;
    }

    HypothesisCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = hypothesisCb_;
    }
    if (cb) cb(copy);
}

void CaptureEngine::onFailure(std::uint64_t session, const VoiceError& error) {
    if (session != captureSession_.load()) return;
    LOG_ERROR("Capture", std::string("Recognition failed: ") + error.what());
    autoStop(session);

    FailureCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = failureCb_;
    }
    if (cb) cb(error);
}

} // namespace Voice
