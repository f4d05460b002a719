#include "whisper_recognizer.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace Voice {

// whisper.cpp refuses input shorter than one second
constexpr std::size_t WHISPER_MIN_SAMPLES = 16000;

static std::string trimCopy(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

WhisperRecognizer::WhisperRecognizer(const WhisperSettings& settings, double sampleRate)
    : settings_(settings), sampleRate_(sampleRate) {
    if (static_cast<int>(sampleRate_) != WHISPER_SAMPLE_RATE) {
        LOG_ERROR("Whisper", "Capture rate " + std::to_string(sampleRate_) +
                             " Hz does not match whisper's " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz");
    }
}

WhisperRecognizer::~WhisperRecognizer() {
    cancel();
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ============================================================
// Lazy Whisper Initialization
// ============================================================
bool WhisperRecognizer::ensureWhisperLoaded() {
    std::lock_guard<std::mutex> lock(loadMutex_);
    if (ctx_) return true;

    fs::path modelPath = getModelPath(settings_.model);
    LOG_DEBUG("Whisper", "Looking for Whisper model at: " + modelPath.string());

    if (!fs::exists(modelPath)) {
        LOG_ERROR("Whisper", "Whisper model missing: " + modelPath.string());
        return false;
    }

    whisper_context_params wparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.string().c_str(), wparams);
    if (!ctx_) {
        LOG_ERROR("Whisper", "Failed to load Whisper model: " + modelPath.string());
        return false;
    }

    LOG_PHASE("Whisper model load", true);
    return true;
}

bool WhisperRecognizer::isAvailable() {
    return ensureWhisperLoaded();
}

// ============================================================
// Session control
// ============================================================
void WhisperRecognizer::joinWorker() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void WhisperRecognizer::beginSession(Callbacks callbacks) {
    // A previous session may still be running its final pass
    joinWorker();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.clear();
        pending_.reserve(static_cast<std::size_t>(sampleRate_) * 2);
        ending_ = false;
        cancelled_ = false;
    }

    worker_ = std::thread([this, cb = std::move(callbacks)]() { run(cb); });
}

void WhisperRecognizer::appendAudio(const float* samples, std::size_t count) {
    if (!samples || count == 0) return;
    std::lock_guard<std::mutex> lock(mtx_);
    if (ending_ || cancelled_) return;
    pending_.insert(pending_.end(), samples, samples + count);
    cv_.notify_one();
}

void WhisperRecognizer::endAudio() {
    std::lock_guard<std::mutex> lock(mtx_);
    ending_ = true;
    cv_.notify_one();
}

void WhisperRecognizer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = true;
        pending_.clear();
        cv_.notify_one();
    }
    joinWorker();
}

// ============================================================
// Whisper Processing
// ============================================================
bool WhisperRecognizer::transcribe(const std::vector<float>& pcm, std::string& text) {
    std::vector<float> padded;
    const std::vector<float>* input = &pcm;
    if (pcm.size() < WHISPER_MIN_SAMPLES) {
        padded = pcm;
        padded.resize(WHISPER_MIN_SAMPLES, 0.0f);
        input = &padded;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.no_timestamps    = true;
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_special    = false;
    params.print_timestamps = false;
    params.n_threads        = settings_.threads;
    params.language         = settings_.language.c_str();
    if (settings_.maxTokens > 0) params.max_tokens = settings_.maxTokens;

    if (whisper_full(ctx_, params, input->data(), static_cast<int>(input->size())) != 0) {
        return false;
    }

    text.clear();
    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        text += whisper_full_get_segment_text(ctx_, i);
    }
    text = trimCopy(text);
    return true;
}

void WhisperRecognizer::run(Callbacks cb) {
    const std::size_t stepSamples = std::max<std::size_t>(
        1, static_cast<std::size_t>(sampleRate_ * settings_.stepMs / 1000.0));
    const std::size_t windowSamples = std::max<std::size_t>(
        stepSamples, static_cast<std::size_t>(sampleRate_ * settings_.windowMs / 1000.0));

    std::vector<float> session;
    session.reserve(windowSamples);
    std::string committed;
    std::string hypothesis;
    std::size_t unprocessed = 0;

    while (true) {
        std::vector<float> fresh;
        bool ending = false;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait_for(lock, std::chrono::milliseconds(100), [&]{
                return cancelled_ || ending_ || pending_.size() >= stepSamples;
            });
            if (cancelled_) return;
            fresh.swap(pending_);
            pending_.reserve(stepSamples * 2);
            ending = ending_;
        }

        session.insert(session.end(), fresh.begin(), fresh.end());
        unprocessed += fresh.size();

        if (unprocessed >= stepSamples || (ending && unprocessed > 0)) {
            std::string text;
            if (!transcribe(session, text)) {
                LOG_ERROR("Whisper", "whisper_full() failed");
                if (cb.onError) cb.onError(VoiceError(ErrorKind::RecognitionFailure, "whisper_full() failed"));
                return;
            }
            unprocessed = 0;

            std::string full = committed.empty() ? text
                             : (text.empty() ? committed : committed + " " + text);
            if (full != hypothesis) {
                hypothesis = full;
                LOG_TRACE("Whisper", "Partial: " + hypothesis);
                if (cb.onHypothesis) cb.onHypothesis(hypothesis);
            }

            // Freeze the text of a full window and start a new one
            if (session.size() >= windowSamples) {
                committed = hypothesis;
                session.clear();
            }
        }

        if (ending) {
            LOG_DEBUG("Whisper", "Session finished: \"" + hypothesis + "\"");
            if (cb.onComplete) cb.onComplete(hypothesis);
            return;
        }
    }
}

} // namespace Voice
