#pragma once
#include <memory>
#include <string>
#include <vector>

#include "voice/session.hpp"

/// LoopbackSession
/// Local stand-in for a remote voice service. Captured speech is
/// collected per utterance and played back as model audio once the
/// speaker goes quiet. Speech onset raises `interrupted`, so talking
/// over the echo cuts it off. Text turns come back as a transcript.
class LoopbackSession : public Session {
public:
    LoopbackSession(EventSink sink, double speechThreshold, int outputRate);
    ~LoopbackSession() override;

    void send(const EncodedAudioChunk& chunk) override;
    void sendText(const std::string& text) override;
    void close() override;

    bool isSpeaking() const { return speaking_; }

private:
    void flushUtterance();
    void emit(InboundEvent event);

    EventSink sink_;
    double threshold_;
    int outputRate_;
    bool closed_ = false;
    bool speaking_ = false;
    int quietFrames_ = 0;
    int inputRate_ = kInputSampleRate;
    std::vector<float> utterance_;
};

class LoopbackConnector : public SessionConnector {
public:
    explicit LoopbackConnector(double speechThreshold = 0.02, int outputRate = kOutputSampleRate)
        : threshold_(speechThreshold), outputRate_(outputRate) {}

    std::unique_ptr<Session> connect(const SessionConfig& config, EventSink sink) override;

private:
    double threshold_;
    int outputRate_;
};
