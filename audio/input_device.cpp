#include "audio/input_device.hpp"
#include "logger.hpp"

#include <string>

PortAudioInput::PortAudioInput(int deviceIndex, std::size_t fftSize, double smoothing)
    : deviceIndex_(deviceIndex), analyser_(fftSize, smoothing) {}

PortAudioInput::~PortAudioInput() {
    stopTracks();
    close();
}

bool PortAudioInput::open(int sampleRate, std::size_t framesPerBuffer) {
    if (stream_) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Mic", std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
        return false;
    }
    paInitialized_ = true;

    int device = (deviceIndex_ >= 0) ? deviceIndex_ : Pa_GetDefaultInputDevice();
    if (device == paNoDevice || device < 0 || device >= Pa_GetDeviceCount()) {
        LOG_ERROR("Mic", "No valid input device found (index=" + std::to_string(device) + ")");
        close();
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(device);
    if (!devInfo || devInfo->maxInputChannels < 1) {
        LOG_ERROR("Mic", "Device " + std::to_string(device) + " has no input channels");
        close();
        return false;
    }

    PaStreamParameters inputParams;
    inputParams.device = device;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    sampleRate_ = sampleRate;
    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        sampleRate,
                        static_cast<unsigned long>(framesPerBuffer),
                        paClipOff,
                        &PortAudioInput::paCallback,
                        this);
    if (err != paNoError || !stream_) {
        LOG_ERROR("Mic", std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
        stream_ = nullptr;
        close();
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        LOG_ERROR("Mic", std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
        close();
        return false;
    }
    streaming_ = true;

    LOG_DEBUG("Mic", std::string("Capturing from \"") + devInfo->name + "\" at " +
                     std::to_string(sampleRate) + " Hz, " +
                     std::to_string(framesPerBuffer) + " samples/frame");
    return true;
}

void PortAudioInput::subscribe(FrameCallback cb) {
    std::lock_guard<std::mutex> lock(cbMtx_);
    onFrame_ = std::move(cb);
}

void PortAudioInput::unsubscribe() {
    std::lock_guard<std::mutex> lock(cbMtx_);
    onFrame_ = nullptr;
}

void PortAudioInput::stopTracks() {
    if (!stream_ || !streaming_) return;
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        LOG_WARN("Mic", std::string("Pa_StopStream: ") + Pa_GetErrorText(err));
    }
    streaming_ = false;
}

void PortAudioInput::close() {
    unsubscribe();
    if (stream_) {
        stopTracks();
        PaError err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            LOG_WARN("Mic", std::string("Pa_CloseStream: ") + Pa_GetErrorText(err));
        }
        stream_ = nullptr;
    }
    if (paInitialized_) {
        Pa_Terminate();
        paInitialized_ = false;
    }
}

int PortAudioInput::paCallback(const void* input, void*, unsigned long frameCount,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                               void* userData) {
    auto* self = static_cast<PortAudioInput*>(userData);
    self->onInput(static_cast<const float*>(input), frameCount);
    return paContinue;
}

void PortAudioInput::onInput(const float* in, unsigned long frameCount) {
    if (!in) return;

    analyser_.push(in, frameCount);

    std::lock_guard<std::mutex> lock(cbMtx_);
    if (!onFrame_) return;
    AudioFrame frame;
    frame.sampleRate = sampleRate_;
    frame.samples.assign(in, in + frameCount);
    onFrame_(frame);
}
