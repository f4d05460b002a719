#include "audio_input.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <sstream>

namespace Audio {

PortAudioInput::PortAudioInput(const CaptureSettings& settings) : settings_(settings) {}

PortAudioInput::~PortAudioInput() {
    stop();
}

std::vector<std::string> PortAudioInput::listInputDevices() {
    std::vector<std::string> out;
    if (Pa_Initialize() != paNoError) return out;

    int num = Pa_GetDeviceCount();
    for (int i = 0; i < num; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        std::ostringstream oss;
        oss << "[" << i << "] " << info->name
            << " — API: " << (api ? api->name : "?")
            << ", inCh: " << info->maxInputChannels
            << ", defaultSR: " << info->defaultSampleRate;
        out.push_back(oss.str());
    }
    Pa_Terminate();
    return out;
}

void PortAudioInput::start(FrameCallback cb) {
    if (stream_) {
        throw VoiceError(ErrorKind::CaptureUnavailable, "Mic stream already open");
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw VoiceError(ErrorKind::CaptureUnavailable,
                         std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
    }

    int deviceIndex = (settings_.inputDeviceIndex >= 0) ? settings_.inputDeviceIndex
                                                       : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        Pa_Terminate();
        throw VoiceError(ErrorKind::CaptureUnavailable, "No valid input device found");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    LOG_DEBUG("Capture", "Using input device: " + std::string(devInfo ? devInfo->name : "?"));

    PaStreamParameters inputParams{};
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo ? devInfo->defaultLowInputLatency : 0.05;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    callback_ = std::move(cb);

    err = Pa_OpenStream(&stream_, &inputParams, nullptr,
                        settings_.sampleRate, settings_.framesPerBuffer,
                        paNoFlag, &PortAudioInput::paCallback, this);
    if (err != paNoError || !stream_) {
        stream_ = nullptr;
        callback_ = nullptr;
        Pa_Terminate();
        throw VoiceError(ErrorKind::CaptureUnavailable,
                         std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        callback_ = nullptr;
        Pa_Terminate();
        throw VoiceError(ErrorKind::CaptureUnavailable,
                         std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
    }

    running_.store(true);
}

void PortAudioInput::stop() {
    if (!stream_) return;

    running_.store(false);
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    callback_ = nullptr;
    Pa_Terminate();
}

int PortAudioInput::paCallback(const void* input,
                               void* /*output*/,
                               unsigned long frameCount,
                               const PaStreamCallbackTimeInfo* /*timeInfo*/,
                               PaStreamCallbackFlags /*statusFlags*/,
                               void* userData) {
    auto* self = static_cast<PortAudioInput*>(userData);
    const float* in = static_cast<const float*>(input);
    if (self && in && self->running_.load() && self->callback_) {
        self->callback_(in, static_cast<std::size_t>(frameCount));
    }
    return paContinue;
}

} // namespace Audio
