#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <SFML/Audio/SoundStream.hpp>

#include "audio/audio_types.hpp"
#include "audio/analyser.hpp"
#include "audio/voice_mixer.hpp"

/// Output graph: a clock in seconds, voices that start at an exact
/// clock time, forced stop, and an analyser tap on the final mix.
class OutputDevice {
public:
    using VoiceId = std::uint64_t;
    using EndedCallback = std::function<void(VoiceId)>;

    virtual ~OutputDevice() = default;

    virtual bool open(int sampleRate) = 0;

    /// Seconds of audio rendered since open().
    virtual double currentTime() const = 0;

    /// Start `buffer` at clock time `when` (clamped to now). Buffer rate
    /// must equal the device rate.
    virtual VoiceId schedule(std::shared_ptr<const PlaybackBuffer> buffer, double when) = 0;

    /// Cut a voice off. Its ended callback does not fire.
    virtual void stopVoice(VoiceId id) = 0;

    /// Called once per voice that played to its last sample. May run on
    /// a device thread.
    virtual void setEndedCallback(EndedCallback cb) = 0;

    /// Release the graph. Idempotent.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual int sampleRate() const = 0;
    virtual Analyser& analyser() = 0;
};

// ------------------------------------------------------------
// SFML mixer stream
// ------------------------------------------------------------
class SfmlOutput : public OutputDevice, private sf::SoundStream {
public:
    explicit SfmlOutput(std::size_t fftSize = 256, double smoothing = 0.8);
    ~SfmlOutput() override;

    bool open(int sampleRate) override;
    double currentTime() const override;
    VoiceId schedule(std::shared_ptr<const PlaybackBuffer> buffer, double when) override;
    void stopVoice(VoiceId id) override;
    void setEndedCallback(EndedCallback cb) override;
    void close() override;
    bool isOpen() const override { return opened_; }
    int sampleRate() const override { return rate_; }
    Analyser& analyser() override { return analyser_; }

private:
    bool onGetData(sf::SoundStream::Chunk& data) override;
    void onSeek(sf::Time timeOffset) override;

    static constexpr std::size_t kChunkFrames = 1024;

    int rate_ = kOutputSampleRate;
    bool opened_ = false;
    VoiceMixer mixer_;

    std::mutex cbMtx_;
    EndedCallback onEnded_;

    // Render scratch, audio thread only
    std::vector<float> mix_;
    std::vector<std::int16_t> pcm_;

    Analyser analyser_;
};
