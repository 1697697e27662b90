#pragma once
#include <cstdint>

class PlaybackScheduler;

/// Barge-in: drop everything queued or playing and rewind the cursor
/// so the next buffer starts now.
class InterruptHandler {
public:
    explicit InterruptHandler(PlaybackScheduler& scheduler) : scheduler_(scheduler) {}

    void onInterrupted();

    std::uint64_t interruptCount() const { return count_; }

private:
    PlaybackScheduler& scheduler_;
    std::uint64_t count_ = 0;
};
