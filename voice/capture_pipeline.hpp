#pragma once
#include <cstdint>
#include <memory>

#include "audio/audio_types.hpp"
#include "event_loop.hpp"

class InputDevice;
class Session;

/// CapturePipeline
/// Microphone frames -> WireCodec -> Session::send, one frame per
/// capture tick, in capture order. Frames that arrive while no session
/// is ready are dropped and counted; nothing is buffered.
class CapturePipeline {
public:
    explicit CapturePipeline(EventLoop& loop);
    ~CapturePipeline();

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    void start(Session* session, InputDevice& input);
    void stop();

    bool isActive() const { return active_; }
    std::uint64_t framesSent() const { return framesSent_; }
    std::uint64_t framesDropped() const { return framesDropped_; }

    // Loop thread only. Exposed for the pipeline and tests.
    void onFrame(const AudioFrame& frame);

private:
    EventLoop& loop_;
    Session* session_ = nullptr;
    InputDevice* input_ = nullptr;
    bool active_ = false;

    // Posted frames check this before touching *this
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    std::uint64_t framesSent_ = 0;
    std::uint64_t framesDropped_ = 0;
};
