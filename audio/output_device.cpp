#include "audio/output_device.hpp"
#include "logger.hpp"

#include <SFML/Audio/SoundChannel.hpp>

#include <algorithm>
#include <cmath>
#include <string>

SfmlOutput::SfmlOutput(std::size_t fftSize, double smoothing)
    : analyser_(fftSize, smoothing) {}

SfmlOutput::~SfmlOutput() {
    // SoundStream requires derived classes to stop before their members die
    close();
}

bool SfmlOutput::open(int sampleRate) {
    if (opened_) return true;
    if (sampleRate <= 0) {
        LOG_ERROR("Speaker", "Invalid output rate " + std::to_string(sampleRate));
        return false;
    }

    rate_ = sampleRate;
    mixer_.reset();
    mix_.assign(kChunkFrames, 0.0f);
    pcm_.assign(kChunkFrames, 0);

    initialize(1, static_cast<unsigned int>(rate_), {sf::SoundChannel::Mono});
    play();

    if (getStatus() != sf::SoundSource::Status::Playing) {
        LOG_ERROR("Speaker", "SFML output stream did not start");
        sf::SoundStream::stop();
        return false;
    }

    opened_ = true;
    LOG_DEBUG("Speaker", "Output graph open at " + std::to_string(rate_) + " Hz");
    return true;
}

double SfmlOutput::currentTime() const {
    return static_cast<double>(mixer_.renderedFrames()) / rate_;
}

OutputDevice::VoiceId SfmlOutput::schedule(std::shared_ptr<const PlaybackBuffer> buffer, double when) {
    if (!buffer) return 0;
    if (buffer->sampleRate != rate_) {
        LOG_WARN("Speaker", "Buffer rate " + std::to_string(buffer->sampleRate) +
                            " != output rate " + std::to_string(rate_));
    }

    auto startFrame = static_cast<std::uint64_t>(std::llround(std::max(0.0, when) * rate_));
    return mixer_.add(std::move(buffer), startFrame);
}

void SfmlOutput::stopVoice(VoiceId id) {
    mixer_.remove(id);
}

void SfmlOutput::setEndedCallback(EndedCallback cb) {
    std::lock_guard<std::mutex> lock(cbMtx_);
    onEnded_ = std::move(cb);
}

void SfmlOutput::close() {
    if (!opened_) return;
    sf::SoundStream::stop();
    mixer_.reset();
    {
        std::lock_guard<std::mutex> lock(cbMtx_);
        onEnded_ = nullptr;
    }
    opened_ = false;
    LOG_DEBUG("Speaker", "Output graph closed");
}

// =========================================================
// Audio thread
// =========================================================
bool SfmlOutput::onGetData(sf::SoundStream::Chunk& data) {
    std::vector<VoiceId> ended = mixer_.render(mix_.data(), kChunkFrames);

    for (std::size_t i = 0; i < kChunkFrames; i++) {
        pcm_[i] = static_cast<std::int16_t>(mix_[i] * 32767.0f);
    }
    analyser_.push(mix_.data(), kChunkFrames);

    EndedCallback onEnded;
    {
        std::lock_guard<std::mutex> lock(cbMtx_);
        onEnded = onEnded_;
    }
    if (onEnded) {
        for (VoiceId id : ended) onEnded(id);
    }

    data.samples = pcm_.data();
    data.sampleCount = kChunkFrames;
    return true;
}

void SfmlOutput::onSeek(sf::Time) {
    // Live stream: nothing to seek
}
