#include "voice/loopback_session.hpp"
#include "audio/wire_codec.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Two quiet frames (~0.5 s at 16 kHz / 4096) end an utterance
static constexpr int kQuietFramesToEnd = 2;
static constexpr double kMaxUtteranceSeconds = 15.0;
static constexpr std::size_t kReplyChunkFrames = 6144;

// "audio/pcm;rate=16000" -> 16000
static int rateFromMimeType(const std::string& mime, int fallback) {
    auto pos = mime.find("rate=");
    if (pos == std::string::npos) return fallback;
    try {
        int rate = std::stoi(mime.substr(pos + 5));
        return rate > 0 ? rate : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

LoopbackSession::LoopbackSession(EventSink sink, double speechThreshold, int outputRate)
    : sink_(std::move(sink)), threshold_(speechThreshold), outputRate_(outputRate) {}

LoopbackSession::~LoopbackSession() {
    closed_ = true;
}

void LoopbackSession::emit(InboundEvent event) {
    if (sink_) sink_(std::move(event));
}

void LoopbackSession::send(const EncodedAudioChunk& chunk) {
    if (closed_) return;

    inputRate_ = rateFromMimeType(chunk.mimeType, kInputSampleRate);
    PlaybackBuffer frame = WireCodec::decodeChunk(chunk.data, inputRate_, 1);
    const double level = WireCodec::rms(frame.samples);
    const bool voiced = level >= threshold_;

    if (voiced && !speaking_) {
        speaking_ = true;
        LOG_TRACE("Loopback", "Speech onset (RMS=" + std::to_string(level) + ")");
        emit(InboundEvent::interrupted());
    }

    if (!speaking_) return;

    const auto maxSamples = static_cast<std::size_t>(kMaxUtteranceSeconds * inputRate_);
    if (utterance_.size() + frame.samples.size() <= maxSamples) {
        utterance_.insert(utterance_.end(), frame.samples.begin(), frame.samples.end());
    }

    quietFrames_ = voiced ? 0 : quietFrames_ + 1;
    if (quietFrames_ >= kQuietFramesToEnd) {
        speaking_ = false;
        quietFrames_ = 0;
        flushUtterance();
    }
}

void LoopbackSession::flushUtterance() {
    if (utterance_.empty()) return;

    PlaybackBuffer captured;
    captured.samples = std::move(utterance_);
    captured.sampleRate = inputRate_;
    captured.channels = 1;
    utterance_.clear();

    PlaybackBuffer reply = WireCodec::resampleLinear(captured, outputRate_);
    LOG_DEBUG("Loopback", "Echoing " + std::to_string(reply.duration()) + "s of speech");

    std::ostringstream label;
    label << "[" << std::fixed << std::setprecision(1) << captured.duration() << "s of speech]";
    emit(InboundEvent::inputTranscription(label.str()));

    for (std::size_t pos = 0; pos < reply.samples.size(); pos += kReplyChunkFrames) {
        std::size_t end = std::min(reply.samples.size(), pos + kReplyChunkFrames);
        AudioFrame part;
        part.sampleRate = outputRate_;
        part.samples.assign(reply.samples.begin() + static_cast<std::ptrdiff_t>(pos),
                            reply.samples.begin() + static_cast<std::ptrdiff_t>(end));
        emit(InboundEvent::audioChunk(WireCodec::encodeFrame(part).data, outputRate_, 1));
    }
    emit(InboundEvent::turnComplete());
}

void LoopbackSession::sendText(const std::string& text) {
    if (closed_) return;
    emit(InboundEvent::outputTranscription(text));
    emit(InboundEvent::turnComplete());
}

void LoopbackSession::close() {
    if (closed_) return;
    closed_ = true;
    utterance_.clear();
    emit(InboundEvent::closed("client closed"));
    LOG_DEBUG("Loopback", "Session closed");
}

std::unique_ptr<Session> LoopbackConnector::connect(const SessionConfig& config, EventSink sink) {
    LOG_DEBUG("Loopback", "Opening loopback session (voice=" + config.voiceName +
                          ", persona " + std::to_string(config.systemInstruction.size()) + " chars)");
    auto session = std::make_unique<LoopbackSession>(sink, threshold_, outputRate_);
    if (sink) sink(InboundEvent::opened());
    return session;
}
