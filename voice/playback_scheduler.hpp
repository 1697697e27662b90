#pragma once
#include <cstdint>
#include <memory>
#include <set>

#include "audio/audio_types.hpp"
#include "audio/output_device.hpp"

/// PlaybackScheduler
/// Gapless, ordered playback on the output clock:
///   start  = max(cursor, now)
///   cursor = start + duration
/// Every scheduled voice sits in the active set until it ends on its
/// own (onEnded) or is cut off (stopAll). Loop thread only.
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(OutputDevice& output);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    /// Returns the start time on the output clock.
    double enqueue(std::shared_ptr<const PlaybackBuffer> buffer);

    /// Natural end of a voice.
    void onEnded(OutputDevice::VoiceId id);

    /// Cut off every active voice and clear the set.
    void stopAll();

    /// Rewind the cursor to 0. Only the interrupt path calls this.
    void resetCursor();

    double cursor() const { return cursor_; }
    std::size_t activeCount() const { return active_.size(); }
    std::uint64_t scheduledCount() const { return scheduled_; }

private:
    OutputDevice& output_;
    double cursor_ = 0.0;
    std::set<OutputDevice::VoiceId> active_;
    std::uint64_t scheduled_ = 0;
};
