#include "voice/session.hpp"

#include <utility>

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:       return "idle";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected:  return "connected";
        case ConnectionState::Error:      return "error";
        case ConnectionState::Closed:     return "closed";
    }
    return "unknown";
}

const char* toString(InboundEvent::Kind kind) {
    using K = InboundEvent::Kind;
    switch (kind) {
        case K::Opened:                   return "opened";
        case K::OutputTranscriptionDelta: return "outputTranscription";
        case K::InputTranscriptionDelta:  return "inputTranscription";
        case K::TurnComplete:             return "turnComplete";
        case K::ModelAudioChunk:          return "modelAudio";
        case K::Interrupted:              return "interrupted";
        case K::Error:                    return "error";
        case K::Closed:                   return "closed";
    }
    return "unknown";
}

InboundEvent InboundEvent::opened() {
    InboundEvent e;
    e.kind = Kind::Opened;
    return e;
}

InboundEvent InboundEvent::outputTranscription(std::string delta) {
    InboundEvent e;
    e.kind = Kind::OutputTranscriptionDelta;
    e.text = std::move(delta);
    return e;
}

InboundEvent InboundEvent::inputTranscription(std::string delta) {
    InboundEvent e;
    e.kind = Kind::InputTranscriptionDelta;
    e.text = std::move(delta);
    return e;
}

InboundEvent InboundEvent::turnComplete() {
    InboundEvent e;
    e.kind = Kind::TurnComplete;
    return e;
}

InboundEvent InboundEvent::audioChunk(std::string base64, int sampleRate, int channels) {
    InboundEvent e;
    e.kind = Kind::ModelAudioChunk;
    e.audio = std::move(base64);
    e.sampleRate = sampleRate;
    e.channels = channels;
    return e;
}

InboundEvent InboundEvent::interrupted() {
    InboundEvent e;
    e.kind = Kind::Interrupted;
    return e;
}

InboundEvent InboundEvent::error(std::string detail) {
    InboundEvent e;
    e.kind = Kind::Error;
    e.text = std::move(detail);
    return e;
}

InboundEvent InboundEvent::closed(std::string reason) {
    InboundEvent e;
    e.kind = Kind::Closed;
    e.text = std::move(reason);
    return e;
}
