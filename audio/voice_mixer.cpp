#include "audio/voice_mixer.hpp"

#include <algorithm>

VoiceMixer::VoiceId VoiceMixer::add(std::shared_ptr<const PlaybackBuffer> buffer,
                                    std::uint64_t startFrame) {
    std::lock_guard<std::mutex> lock(mtx_);
    VoiceId id = nextId_++;
    voices_.push_back({id, std::move(buffer), std::max(startFrame, rendered_.load())});
    return id;
}

bool VoiceMixer::remove(VoiceId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(voices_.begin(), voices_.end(),
                           [id](const Voice& v) { return v.id == id; });
    if (it == voices_.end()) return false;
    voices_.erase(it);
    return true;
}

void VoiceMixer::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    voices_.clear();
    rendered_ = 0;
}

std::optional<std::uint64_t> VoiceMixer::startFrame(VoiceId id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const Voice& v : voices_) {
        if (v.id == id) return v.startFrame;
    }
    return std::nullopt;
}

std::size_t VoiceMixer::voiceCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return voices_.size();
}

std::vector<VoiceMixer::VoiceId> VoiceMixer::render(float* out, std::size_t frames) {
    std::fill(out, out + frames, 0.0f);
    std::vector<VoiceId> ended;

    std::lock_guard<std::mutex> lock(mtx_);
    const std::uint64_t blockStart = rendered_.load();
    const std::uint64_t blockEnd = blockStart + frames;

    for (const Voice& v : voices_) {
        const PlaybackBuffer& buf = *v.buffer;
        const auto channels = static_cast<std::size_t>(std::max(buf.channels, 1));
        const std::uint64_t voiceEnd = v.startFrame + buf.frameCount();
        const std::uint64_t from = std::max(blockStart, v.startFrame);
        const std::uint64_t to = std::min(blockEnd, voiceEnd);

        // Downmix interleaved channels
        for (std::uint64_t t = from; t < to; t++) {
            const auto frame = static_cast<std::size_t>(t - v.startFrame);
            float sum = 0.0f;
            for (std::size_t c = 0; c < channels; c++) {
                sum += buf.samples[frame * channels + c];
            }
            out[t - blockStart] += sum / static_cast<float>(channels);
        }
        if (voiceEnd <= blockEnd) ended.push_back(v.id);
    }

    voices_.erase(std::remove_if(voices_.begin(), voices_.end(),
                                 [blockEnd](const Voice& v) {
                                     return v.startFrame + v.buffer->frameCount() <= blockEnd;
                                 }),
                  voices_.end());

    for (std::size_t i = 0; i < frames; i++) {
        out[i] = std::clamp(out[i], -1.0f, 1.0f);
    }
    rendered_ = blockEnd;
    return ended;
}
