#pragma once
#include <functional>
#include <memory>
#include <string>

#include "audio/audio_types.hpp"

enum class ConnectionState {
    Idle,
    Connecting,
    Connected,
    Error,
    Closed
};

const char* toString(ConnectionState state);

// ------------------------------------------------------------
// InboundEvent: everything a session can tell the pipeline
// ------------------------------------------------------------
struct InboundEvent {
    enum class Kind {
        Opened,
        OutputTranscriptionDelta,
        InputTranscriptionDelta,
        TurnComplete,
        ModelAudioChunk,
        Interrupted,
        Error,
        Closed
    };

    Kind kind = Kind::Opened;
    std::string text;                     // transcription delta or error detail
    std::string audio;                    // base64 PCM16 LE
    int sampleRate = kOutputSampleRate;
    int channels = 1;

    static InboundEvent opened();
    static InboundEvent outputTranscription(std::string delta);
    static InboundEvent inputTranscription(std::string delta);
    static InboundEvent turnComplete();
    static InboundEvent audioChunk(std::string base64, int sampleRate = kOutputSampleRate, int channels = 1);
    static InboundEvent interrupted();
    static InboundEvent error(std::string detail);
    static InboundEvent closed(std::string reason = "");
};

const char* toString(InboundEvent::Kind kind);

// Receives events from the transport. May be called from any thread.
using EventSink = std::function<void(InboundEvent)>;

// ------------------------------------------------------------
// Session: one live bidirectional connection
// ------------------------------------------------------------
class Session {
public:
    virtual ~Session() = default;

    virtual void send(const EncodedAudioChunk& chunk) = 0;
    virtual void sendText(const std::string& text) = 0;

    /// Close the connection. Repeated calls are harmless.
    virtual void close() = 0;
};

struct SessionConfig {
    std::string model;
    std::string voiceName;
    std::string systemInstruction;   // opaque persona text
};

// ------------------------------------------------------------
// SessionConnector: opens sessions. connect() may throw.
// ------------------------------------------------------------
class SessionConnector {
public:
    virtual ~SessionConnector() = default;

    virtual std::unique_ptr<Session> connect(const SessionConfig& config, EventSink sink) = 0;
};
