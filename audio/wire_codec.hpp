#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio/audio_types.hpp"

namespace WireCodec {

    /// Raised for any inbound payload that cannot become a PlaybackBuffer.
    class DecodeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // ---------------- Base64 ----------------
    std::string base64Encode(const std::uint8_t* data, std::size_t length);
    std::vector<std::uint8_t> base64Decode(const std::string& text);   // throws DecodeError

    // ---------------- PCM16 ----------------
    // Scale by 32768 and clamp to the int16 range.
    std::vector<std::int16_t> floatToPcm16(const std::vector<float>& samples);

    // Little-endian byte image of PCM16 samples.
    std::vector<std::uint8_t> pcm16ToBytes(const std::vector<std::int16_t>& pcm);

    // ---------------- Frames / chunks ----------------
    std::string mimeTypeFor(int sampleRate);

    EncodedAudioChunk encodeFrame(const AudioFrame& frame);

    // base64 PCM16 LE, interleaved channels, sample / 32768.
    PlaybackBuffer decodeChunk(const std::string& base64Pcm, int sampleRate, int channels);

    // Linear interpolation per channel. Identity when rates already match.
    PlaybackBuffer resampleLinear(const PlaybackBuffer& in, int targetRate);

    // Root mean square of a frame; 0 for an empty frame.
    double rms(const std::vector<float>& samples);
}
