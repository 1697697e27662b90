#pragma once
#include <cstddef>
#include <string>
#include <vector>

// ---------------- Rates ----------------
inline constexpr int kInputSampleRate  = 16000;
inline constexpr int kOutputSampleRate = 24000;
inline constexpr std::size_t kCaptureFrameSize = 4096;

/// One capture tick of mono microphone samples in [-1, 1].
/// Sent immediately, never retained.
struct AudioFrame {
    std::vector<float> samples;
    int sampleRate = kInputSampleRate;
};

/// Wire form of an AudioFrame: base64 PCM16 little-endian.
struct EncodedAudioChunk {
    std::string data;
    std::string mimeType;   // "audio/pcm;rate=16000"
};

/// Decoded model speech at the output rate. Samples are interleaved
/// when channels > 1.
struct PlaybackBuffer {
    std::vector<float> samples;
    int sampleRate = kOutputSampleRate;
    int channels = 1;

    std::size_t frameCount() const {
        return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
    }

    double duration() const {
        return sampleRate > 0 ? static_cast<double>(frameCount()) / sampleRate : 0.0;
    }
};
