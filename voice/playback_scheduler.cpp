#include "voice/playback_scheduler.hpp"
#include "audio/wire_codec.hpp"
#include "logger.hpp"

#include <algorithm>

PlaybackScheduler::PlaybackScheduler(OutputDevice& output) : output_(output) {}

PlaybackScheduler::~PlaybackScheduler() {
    stopAll();
}

double PlaybackScheduler::enqueue(std::shared_ptr<const PlaybackBuffer> buffer) {
    const double now = output_.currentTime();
    if (!buffer || buffer->frameCount() == 0) {
        LOG_TRACE("Playback", "Skipping empty buffer");
        return std::max(cursor_, now);
    }

    if (buffer->sampleRate != output_.sampleRate()) {
        buffer = std::make_shared<const PlaybackBuffer>(
            WireCodec::resampleLinear(*buffer, output_.sampleRate()));
    }

    const double start = std::max(cursor_, now);
    const double duration = buffer->duration();

    OutputDevice::VoiceId id = output_.schedule(std::move(buffer), start);
    cursor_ = start + duration;
    active_.insert(id);
    scheduled_++;

    LOG_TRACE("Playback", "Scheduled voice " + std::to_string(id) +
                          " at " + std::to_string(start) +
                          "s (" + std::to_string(duration) + "s), active=" +
                          std::to_string(active_.size()));
    return start;
}

void PlaybackScheduler::onEnded(OutputDevice::VoiceId id) {
    active_.erase(id);
}

void PlaybackScheduler::stopAll() {
    if (active_.empty()) return;
    for (OutputDevice::VoiceId id : active_) {
        output_.stopVoice(id);
    }
    LOG_DEBUG("Playback", "Stopped " + std::to_string(active_.size()) + " voice(s)");
    active_.clear();
}

void PlaybackScheduler::resetCursor() {
    cursor_ = 0.0;
}
