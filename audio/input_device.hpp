#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include <portaudio.h>

#include "audio/audio_types.hpp"
#include "audio/analyser.hpp"

/// Input graph: microphone source, an always-on analyser tap and an
/// optional fixed-size frame subscriber.
class InputDevice {
public:
    using FrameCallback = std::function<void(const AudioFrame&)>;

    virtual ~InputDevice() = default;

    /// Acquire the microphone. False means access was refused or no
    /// device is usable.
    virtual bool open(int sampleRate, std::size_t framesPerBuffer) = 0;

    /// Frame callbacks run on a device thread.
    virtual void subscribe(FrameCallback cb) = 0;
    virtual void unsubscribe() = 0;

    /// Stop the media stream (mic light off). Idempotent.
    virtual void stopTracks() = 0;

    /// Release the graph. Idempotent.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual Analyser& analyser() = 0;
};

// ------------------------------------------------------------
// PortAudio microphone
// ------------------------------------------------------------
class PortAudioInput : public InputDevice {
public:
    /// deviceIndex < 0 selects the default input device.
    explicit PortAudioInput(int deviceIndex = -1, std::size_t fftSize = 256, double smoothing = 0.8);
    ~PortAudioInput() override;

    bool open(int sampleRate, std::size_t framesPerBuffer) override;
    void subscribe(FrameCallback cb) override;
    void unsubscribe() override;
    void stopTracks() override;
    void close() override;
    bool isOpen() const override { return stream_ != nullptr; }
    Analyser& analyser() override { return analyser_; }

private:
    static int paCallback(const void* input, void* output, unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags, void* userData);
    void onInput(const float* in, unsigned long frameCount);

    int deviceIndex_;
    int sampleRate_ = kInputSampleRate;
    bool paInitialized_ = false;
    bool streaming_ = false;
    PaStream* stream_ = nullptr;
    Analyser analyser_;

    std::mutex cbMtx_;
    FrameCallback onFrame_;
};
