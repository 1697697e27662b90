#include "voice/capture_pipeline.hpp"
#include "voice/session.hpp"
#include "audio/input_device.hpp"
#include "audio/wire_codec.hpp"
#include "logger.hpp"

#include <exception>

CapturePipeline::CapturePipeline(EventLoop& loop) : loop_(loop) {}

CapturePipeline::~CapturePipeline() {
    stop();
}

void CapturePipeline::start(Session* session, InputDevice& input) {
    if (active_) return;

    session_ = session;
    input_ = &input;
    active_ = true;

    std::weak_ptr<int> alive = alive_;
    EventLoop* loop = &loop_;
    input.subscribe([this, alive, loop](const AudioFrame& frame) {
        // Device thread: hand the frame to the loop
        loop->post([this, alive, frame]() {
            if (alive.expired()) return;
            onFrame(frame);
        });
    });

    LOG_DEBUG("Capture", "Capture started");
}

void CapturePipeline::stop() {
    if (!active_) return;
    active_ = false;
    if (input_) input_->unsubscribe();
    input_ = nullptr;
    session_ = nullptr;
    LOG_DEBUG("Capture", "Capture stopped (sent=" + std::to_string(framesSent_) +
                         ", dropped=" + std::to_string(framesDropped_) + ")");
}

void CapturePipeline::onFrame(const AudioFrame& frame) {
    if (!active_ || !session_) {
        framesDropped_++;
        return;
    }

    try {
        session_->send(WireCodec::encodeFrame(frame));
        framesSent_++;
    } catch (const std::exception& e) {
        framesDropped_++;
        LOG_WARN("Capture", std::string("send failed: ") + e.what());
    }
}
