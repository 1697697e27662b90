#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "audio/audio_types.hpp"

/// VoiceMixer
/// Frame-accurate mono mix of voices that start at a given output
/// frame. add() and render() share one lock, so a voice can never be
/// placed behind the render position and lose its first samples.
class VoiceMixer {
public:
    using VoiceId = std::uint64_t;

    /// Start is clamped to the next frame render() will produce.
    VoiceId add(std::shared_ptr<const PlaybackBuffer> buffer, std::uint64_t startFrame);

    /// Drop a voice without reporting it as ended.
    bool remove(VoiceId id);

    /// Forget all voices and rewind the clock to frame 0.
    void reset();

    /// Mix the next `frames` frames into `out` (clamped to [-1, 1]) and
    /// return the voices that played their last sample in this block.
    std::vector<VoiceId> render(float* out, std::size_t frames);

    std::uint64_t renderedFrames() const { return rendered_.load(); }
    std::optional<std::uint64_t> startFrame(VoiceId id) const;
    std::size_t voiceCount() const;

private:
    struct Voice {
        VoiceId id;
        std::shared_ptr<const PlaybackBuffer> buffer;
        std::uint64_t startFrame;
    };

    mutable std::mutex mtx_;
    std::vector<Voice> voices_;
    VoiceId nextId_ = 1;
    std::atomic<std::uint64_t> rendered_{0};
};
