#include "voice/voice_pipeline.hpp"
#include "voice/capture_pipeline.hpp"
#include "voice/interrupt_handler.hpp"
#include "voice/level_meter.hpp"
#include "voice/playback_scheduler.hpp"
#include "audio/input_device.hpp"
#include "audio/output_device.hpp"
#include "audio/wire_codec.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <exception>

VoicePipeline::VoicePipeline(EventLoop& loop,
                             SessionConnector& connector,
                             InputFactory makeInput,
                             OutputFactory makeOutput,
                             PipelineOptions options)
    : loop_(loop),
      connector_(connector),
      makeInput_(std::move(makeInput)),
      makeOutput_(std::move(makeOutput)),
      options_(std::move(options)) {}

VoicePipeline::~VoicePipeline() {
    onState_ = nullptr;
    onLevel_ = nullptr;
    onMessage_ = nullptr;
    onTranscript_ = nullptr;
    onTurn_ = nullptr;
    closeSession();
    teardown();
}

// =========================================================
// connect
// =========================================================
bool VoicePipeline::start() {
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
        LOG_WARN("Pipeline", std::string("start() ignored, already ") + toString(state_));
        return false;
    }

    const std::uint64_t gen = ++generation_;
    tornDown_ = false;
    lastError_.clear();
    lastErrorMessage_.clear();
    transcript_.clear();
    setState(ConnectionState::Connecting);
    LOG_PHASE("Pipeline connect", true);

    // Microphone
    input_ = makeInput_ ? makeInput_() : nullptr;
    if (!input_ || !input_->open(options_.inputSampleRate, options_.frameSize)) {
        fail("ERR_MIC_PERMISSION_DENIED");
        return false;
    }

    // Speaker
    output_ = makeOutput_ ? makeOutput_() : nullptr;
    if (!output_ || !output_->open(options_.outputSampleRate)) {
        fail("ERR_OUTPUT_DEVICE_UNAVAILABLE");
        return false;
    }

    scheduler_ = std::make_unique<PlaybackScheduler>(*output_);
    interrupts_ = std::make_unique<InterruptHandler>(*scheduler_);
    capture_ = std::make_unique<CapturePipeline>(loop_);

    std::weak_ptr<int> alive = alive_;
    EventLoop* loop = &loop_;
    output_->setEndedCallback([this, alive, loop, gen](OutputDevice::VoiceId id) {
        loop->post([this, alive, gen, id]() {
            if (alive.expired() || gen != generation_ || !scheduler_) return;
            scheduler_->onEnded(id);
        });
    });

    meter_ = std::make_unique<LevelMeter>(loop_, options_.levelInterval);
    meter_->attach(&input_->analyser(), &output_->analyser());
    meter_->onLevel([this](double user, double ai) { publishLevels(user, ai); });
    meter_->start();

    // Session
    try {
        session_ = connector_.connect(options_.session, makeSink(gen));
    } catch (const std::exception& e) {
        fail("ERR_SESSION_OPEN_FAILED", e.what());
        return false;
    }
    if (!session_) {
        fail("ERR_SESSION_OPEN_FAILED", "connector returned no session");
        return false;
    }

    LOG_DEBUG("Pipeline", "Session requested (generation " + std::to_string(gen) + ")");
    return true;
}

// =========================================================
// disconnect
// =========================================================
void VoicePipeline::stop() {
    setState(ConnectionState::Closed);
    closeSession();
    teardown();
}

bool VoicePipeline::send(const EncodedAudioChunk& chunk) {
    if (state_ != ConnectionState::Connected || !session_) return false;
    try {
        session_->send(chunk);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Pipeline", std::string("send failed: ") + e.what());
        return false;
    }
}

bool VoicePipeline::sendText(const std::string& text) {
    if (state_ != ConnectionState::Connected || !session_) {
        LOG_DEBUG("Pipeline", "sendText ignored, not connected");
        return false;
    }
    try {
        session_->sendText(text);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Pipeline", std::string("sendText failed: ") + e.what());
        return false;
    }
}

// =========================================================
// Inbound events
// =========================================================
EventSink VoicePipeline::makeSink(std::uint64_t gen) {
    std::weak_ptr<int> alive = alive_;
    EventLoop* loop = &loop_;
    return [this, alive, loop, gen](InboundEvent event) {
        loop->post([this, alive, gen, event]() {
            if (alive.expired()) return;
            if (gen != generation_) {
                LOG_TRACE("Pipeline", std::string("Stale ") + toString(event.kind) +
                                      " from generation " + std::to_string(gen));
                return;
            }
            dispatch(event);
        });
    };
}

void VoicePipeline::dispatch(const InboundEvent& event) {
    using Kind = InboundEvent::Kind;

    // After teardown only a late close still matters (error -> closed)
    if (tornDown_ && event.kind != Kind::Closed) return;

    if (onMessage_) onMessage_(event);

    switch (event.kind) {
        case Kind::Opened:
            if (state_ != ConnectionState::Connecting) {
                LOG_WARN("Pipeline", std::string("opened while ") + toString(state_));
                return;
            }
            setState(ConnectionState::Connected);
            LOG_PHASE("Session open", true);
            capture_->start(session_.get(), *input_);
            break;

        case Kind::OutputTranscriptionDelta:
            transcript_.appendAssistant(event.text);
            publishTranscript();
            break;

        case Kind::InputTranscriptionDelta:
            transcript_.appendUser(event.text);
            publishTranscript();
            break;

        case Kind::TurnComplete: {
            Turn turn = transcript_.completeTurn();
            LOG_DEBUG("Pipeline", "Turn complete: user=\"" + turn.user +
                                  "\" assistant=\"" + turn.assistant + "\"");
            if (onTurn_) onTurn_(turn);
            publishTranscript();
            break;
        }

        case Kind::ModelAudioChunk:
            handleAudio(event);
            break;

        case Kind::Interrupted:
            if (interrupts_) interrupts_->onInterrupted();
            break;

        case Kind::Error:
            if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
                lastError_ = "ERR_SESSION_ERROR";
                lastErrorMessage_ = ErrorManager::report(lastError_, event.text).message;
                setState(ConnectionState::Error);
            }
            closeSession();
            teardown();
            break;

        case Kind::Closed:
            if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
                // Remote hangup or network drop; reconnect is up to the user
                lastError_ = "ERR_SESSION_CLOSED";
                lastErrorMessage_ = ErrorManager::report(lastError_, event.text).message;
            }
            if (state_ != ConnectionState::Idle) setState(ConnectionState::Closed);
            closeSession();
            teardown();
            break;
    }
}

void VoicePipeline::handleAudio(const InboundEvent& event) {
    if (!scheduler_) return;
    try {
        auto buffer = std::make_shared<PlaybackBuffer>(
            WireCodec::decodeChunk(event.audio, event.sampleRate, event.channels));
        scheduler_->enqueue(std::move(buffer));
    } catch (const WireCodec::DecodeError& e) {
        // Skip the chunk; the session and the scheduler carry on
        decodeFailures_++;
        ErrorManager::report("ERR_AUDIO_DECODE", e.what());
    }
}

// =========================================================
// Helpers
// =========================================================
void VoicePipeline::setState(ConnectionState next) {
    if (state_ == next) return;
    LOG_DEBUG("Pipeline", std::string("State ") + toString(state_) + " -> " + toString(next));
    state_ = next;
    if (onState_) onState_(next);
}

void VoicePipeline::fail(const std::string& code, const std::string& detail) {
    lastError_ = code;
    lastErrorMessage_ = detail.empty() ? ErrorManager::report(code).message
                                       : ErrorManager::report(code, detail).message;
    LOG_PHASE("Pipeline connect", false);
    setState(ConnectionState::Error);
    closeSession();
    teardown();
}

void VoicePipeline::publishTranscript() {
    if (onTranscript_) onTranscript_(transcript_.user(), transcript_.assistant());
}

void VoicePipeline::publishLevels(double user, double ai) {
    userLevel_ = user;
    aiLevel_ = ai;
    if (onLevel_) onLevel_(user, ai);
}

void VoicePipeline::closeSession() {
    if (!session_) return;
    try {
        session_->close();
    } catch (const std::exception& e) {
        LOG_WARN("Pipeline", std::string("session close: ") + e.what());
    }
    session_.reset();
}

void VoicePipeline::teardown() {
    if (tornDown_) return;
    tornDown_ = true;

    if (capture_) {
        capture_->stop();
        sentTotal_ += capture_->framesSent();
        droppedTotal_ += capture_->framesDropped();
    }
    if (meter_) meter_->stop();
    if (scheduler_) scheduler_->stopAll();
    if (interrupts_) interruptTotal_ += interrupts_->interruptCount();

    if (input_) {
        input_->stopTracks();
        input_->close();
    }
    if (output_) {
        output_->setEndedCallback(nullptr);
        output_->close();
    }

    interrupts_.reset();
    scheduler_.reset();
    capture_.reset();
    meter_.reset();
    session_.reset();
    input_.reset();
    output_.reset();

    publishLevels(0.0, 0.0);
    LOG_PHASE("Pipeline teardown", true);
}

// =========================================================
// Observers
// =========================================================
std::uint64_t VoicePipeline::framesSent() const {
    return sentTotal_ + (capture_ ? capture_->framesSent() : 0);
}

std::uint64_t VoicePipeline::framesDropped() const {
    return droppedTotal_ + (capture_ ? capture_->framesDropped() : 0);
}

std::uint64_t VoicePipeline::interruptCount() const {
    return interruptTotal_ + (interrupts_ ? interrupts_->interruptCount() : 0);
}

std::size_t VoicePipeline::activeBuffers() const {
    return scheduler_ ? scheduler_->activeCount() : 0;
}

double VoicePipeline::scheduleCursor() const {
    return scheduler_ ? scheduler_->cursor() : 0.0;
}
