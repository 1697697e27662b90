#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "audio/audio_types.hpp"
#include "event_loop.hpp"
#include "voice/session.hpp"
#include "voice/transcript.hpp"

class InputDevice;
class OutputDevice;
class CapturePipeline;
class PlaybackScheduler;
class InterruptHandler;
class LevelMeter;

struct PipelineOptions {
    int inputSampleRate = kInputSampleRate;
    int outputSampleRate = kOutputSampleRate;
    std::size_t frameSize = kCaptureFrameSize;
    std::chrono::milliseconds levelInterval{16};
    SessionConfig session;
};

// ------------------------------------------------------------
// VoicePipeline
// Owns one conversation attempt end to end: devices, session,
// capture, playback, barge-in and metering. Every method and every
// callback runs on the event loop; transport and device threads only
// post into it.
//
//   idle -> connecting -> connected -> { error | closed }
//
// Each start() opens a new generation. Events from an earlier
// generation are discarded. Teardown runs at most once per generation
// whichever exit path reaches it first.
// ------------------------------------------------------------
class VoicePipeline {
public:
    using InputFactory = std::function<std::unique_ptr<InputDevice>()>;
    using OutputFactory = std::function<std::unique_ptr<OutputDevice>()>;

    using StateCallback = std::function<void(ConnectionState)>;
    using LevelCallback = std::function<void(double user, double ai)>;
    using MessageCallback = std::function<void(const InboundEvent&)>;
    using TranscriptCallback = std::function<void(const std::string& user, const std::string& assistant)>;
    using TurnCallback = std::function<void(const Turn&)>;

    VoicePipeline(EventLoop& loop,
                  SessionConnector& connector,
                  InputFactory makeInput,
                  OutputFactory makeOutput,
                  PipelineOptions options = {});
    ~VoicePipeline();

    VoicePipeline(const VoicePipeline&) = delete;
    VoicePipeline& operator=(const VoicePipeline&) = delete;

    /// connect(). False when already active or when any step failed;
    /// lastError() then holds the error code.
    bool start();

    /// disconnect(). Always ends in Closed. Safe to repeat.
    void stop();

    /// Forward to the live session. False unless connected.
    bool send(const EncodedAudioChunk& chunk);
    bool sendText(const std::string& text);

    /// Single entry point for inbound events of the current generation.
    void dispatch(const InboundEvent& event);

    void onState(StateCallback cb) { onState_ = std::move(cb); }
    void onLevel(LevelCallback cb) { onLevel_ = std::move(cb); }
    void onMessage(MessageCallback cb) { onMessage_ = std::move(cb); }
    void onTranscript(TranscriptCallback cb) { onTranscript_ = std::move(cb); }
    void onTurn(TurnCallback cb) { onTurn_ = std::move(cb); }

    ConnectionState state() const { return state_; }
    const std::string& lastError() const { return lastError_; }
    const std::string& lastErrorMessage() const { return lastErrorMessage_; }
    const TranscriptAccumulator& transcript() const { return transcript_; }
    std::uint64_t generation() const { return generation_; }
    const PipelineOptions& options() const { return options_; }

    double userLevel() const { return userLevel_; }
    double aiLevel() const { return aiLevel_; }

    std::uint64_t framesSent() const;
    std::uint64_t framesDropped() const;
    std::uint64_t decodeFailures() const { return decodeFailures_; }
    std::uint64_t interruptCount() const;
    std::size_t activeBuffers() const;
    double scheduleCursor() const;

private:
    EventSink makeSink(std::uint64_t generation);
    void setState(ConnectionState next);
    void fail(const std::string& code, const std::string& detail = "");
    void handleAudio(const InboundEvent& event);
    void publishTranscript();
    void publishLevels(double user, double ai);
    void closeSession();
    void teardown();

    EventLoop& loop_;
    SessionConnector& connector_;
    InputFactory makeInput_;
    OutputFactory makeOutput_;
    PipelineOptions options_;

    ConnectionState state_ = ConnectionState::Idle;
    std::uint64_t generation_ = 0;
    bool tornDown_ = true;
    std::string lastError_;
    std::string lastErrorMessage_;

    // Per-generation resources, released by teardown()
    std::unique_ptr<InputDevice> input_;
    std::unique_ptr<OutputDevice> output_;
    std::unique_ptr<Session> session_;
    std::unique_ptr<LevelMeter> meter_;
    std::unique_ptr<CapturePipeline> capture_;
    std::unique_ptr<PlaybackScheduler> scheduler_;
    std::unique_ptr<InterruptHandler> interrupts_;

    TranscriptAccumulator transcript_;
    double userLevel_ = 0.0;
    double aiLevel_ = 0.0;

    // Totals carried over from finished generations
    std::uint64_t sentTotal_ = 0;
    std::uint64_t droppedTotal_ = 0;
    std::uint64_t interruptTotal_ = 0;
    std::uint64_t decodeFailures_ = 0;

    StateCallback onState_;
    LevelCallback onLevel_;
    MessageCallback onMessage_;
    TranscriptCallback onTranscript_;
    TurnCallback onTurn_;

    // Posted tasks check this before touching *this
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};
