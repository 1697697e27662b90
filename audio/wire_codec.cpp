#include "audio/wire_codec.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace {
    const char* kBase64Chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    // -1 = not part of the alphabet
    std::array<int, 256> buildDecodeTable() {
        std::array<int, 256> table{};
        table.fill(-1);
        for (int i = 0; i < 64; i++) {
            table[static_cast<unsigned char>(kBase64Chars[i])] = i;
        }
        return table;
    }
}

namespace WireCodec {

// =========================================================
// Base64
// =========================================================
std::string base64Encode(const std::uint8_t* data, std::size_t length) {
    std::string encoded;
    encoded.reserve(((length + 2) / 3) * 4);

    int val = 0, valb = -6;
    for (std::size_t i = 0; i < length; i++) {
        val = ((val << 8) + data[i]) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(kBase64Chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) encoded.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4) encoded.push_back('=');
    return encoded;
}

std::vector<std::uint8_t> base64Decode(const std::string& text) {
    static const std::array<int, 256> table = buildDecodeTable();

    std::vector<std::uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    int val = 0, valb = -8;
    std::size_t padding = 0;
    std::size_t symbols = 0;
    for (char c : text) {
        if (c == '=') {
            padding++;
            continue;
        }
        if (c == '\n' || c == '\r') continue;
        if (padding > 0) {
            throw DecodeError("base64: data after padding");
        }
        int d = table[static_cast<unsigned char>(c)];
        if (d < 0) {
            throw DecodeError(std::string("base64: invalid character '") + c + "'");
        }
        symbols++;
        val = ((val << 6) + d) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    if (padding > 2) {
        throw DecodeError("base64: too much padding");
    }
    // A lone symbol in the last group carries less than one byte
    if (symbols % 4 == 1) {
        throw DecodeError("base64: truncated group");
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        throw DecodeError("base64: padding does not complete a group");
    }
    // Bits left over after the last byte must be zero
    const int leftover = valb + 8;
    if (leftover > 0 && (val & ((1 << leftover) - 1)) != 0) {
        throw DecodeError("base64: non-zero trailing bits");
    }
    return out;
}

// =========================================================
// PCM16
// =========================================================
std::vector<std::int16_t> floatToPcm16(const std::vector<float>& samples) {
    std::vector<std::int16_t> pcm(samples.size());
    for (std::size_t i = 0; i < samples.size(); i++) {
        float scaled = samples[i] * 32768.0f;
        scaled = std::clamp(scaled, -32768.0f, 32767.0f);
        pcm[i] = static_cast<std::int16_t>(scaled);
    }
    return pcm;
}

std::vector<std::uint8_t> pcm16ToBytes(const std::vector<std::int16_t>& pcm) {
    std::vector<std::uint8_t> bytes(pcm.size() * 2);
    for (std::size_t i = 0; i < pcm.size(); i++) {
        auto u = static_cast<std::uint16_t>(pcm[i]);
        bytes[2 * i]     = static_cast<std::uint8_t>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<std::uint8_t>((u >> 8) & 0xFF);
    }
    return bytes;
}

// =========================================================
// Frames / chunks
// =========================================================
std::string mimeTypeFor(int sampleRate) {
    return "audio/pcm;rate=" + std::to_string(sampleRate);
}

EncodedAudioChunk encodeFrame(const AudioFrame& frame) {
    auto bytes = pcm16ToBytes(floatToPcm16(frame.samples));
    EncodedAudioChunk chunk;
    chunk.data = base64Encode(bytes.data(), bytes.size());
    chunk.mimeType = mimeTypeFor(frame.sampleRate);
    return chunk;
}

PlaybackBuffer decodeChunk(const std::string& base64Pcm, int sampleRate, int channels) {
    if (sampleRate <= 0) {
        throw DecodeError("invalid sample rate " + std::to_string(sampleRate));
    }
    if (channels <= 0) {
        throw DecodeError("invalid channel count " + std::to_string(channels));
    }

    std::vector<std::uint8_t> bytes = base64Decode(base64Pcm);
    if (bytes.empty()) {
        throw DecodeError("empty audio payload");
    }
    const std::size_t frameBytes = 2 * static_cast<std::size_t>(channels);
    if (bytes.size() % frameBytes != 0) {
        throw DecodeError("payload of " + std::to_string(bytes.size()) +
                          " bytes is not a whole number of " +
                          std::to_string(channels) + "-channel PCM16 frames");
    }

    PlaybackBuffer buffer;
    buffer.sampleRate = sampleRate;
    buffer.channels = channels;
    buffer.samples.resize(bytes.size() / 2);
    for (std::size_t i = 0; i < buffer.samples.size(); i++) {
        auto u = static_cast<std::uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
        buffer.samples[i] = static_cast<float>(static_cast<std::int16_t>(u)) / 32768.0f;
    }
    return buffer;
}

PlaybackBuffer resampleLinear(const PlaybackBuffer& in, int targetRate) {
    if (targetRate <= 0 || in.sampleRate <= 0 || in.channels <= 0) {
        throw DecodeError("cannot resample buffer with rate " + std::to_string(in.sampleRate) +
                          " to " + std::to_string(targetRate));
    }
    if (in.sampleRate == targetRate || in.samples.empty()) {
        PlaybackBuffer copy = in;
        copy.sampleRate = targetRate;
        return copy;
    }

    const std::size_t channels = static_cast<std::size_t>(in.channels);
    const std::size_t inFrames = in.frameCount();
    const double ratio = static_cast<double>(in.sampleRate) / targetRate;
    const auto outFrames = static_cast<std::size_t>(
        std::llround(static_cast<double>(inFrames) * targetRate / in.sampleRate));

    PlaybackBuffer out;
    out.sampleRate = targetRate;
    out.channels = in.channels;
    out.samples.resize(outFrames * channels);

    for (std::size_t f = 0; f < outFrames; f++) {
        double pos = f * ratio;
        auto i0 = static_cast<std::size_t>(pos);
        std::size_t i1 = std::min(i0 + 1, inFrames - 1);
        i0 = std::min(i0, inFrames - 1);
        double frac = pos - static_cast<double>(i0);
        for (std::size_t c = 0; c < channels; c++) {
            double a = in.samples[i0 * channels + c];
            double b = in.samples[i1 * channels + c];
            out.samples[f * channels + c] = static_cast<float>(a + (b - a) * frac);
        }
    }
    return out;
}

double rms(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0;
    double energy = 0.0;
    for (float s : samples) energy += static_cast<double>(s) * s;
    return std::sqrt(energy / samples.size());
}

} // namespace WireCodec
