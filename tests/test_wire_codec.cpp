#include <gtest/gtest.h>

#include "audio/wire_codec.hpp"

#include <cmath>

using namespace WireCodec;

static std::string encodeText(const std::string& s) {
    return base64Encode(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

TEST(WireCodec, Base64KnownVectors) {
    EXPECT_EQ(encodeText(""), "");
    EXPECT_EQ(encodeText("M"), "TQ==");
    EXPECT_EQ(encodeText("Ma"), "TWE=");
    EXPECT_EQ(encodeText("Man"), "TWFu");
    EXPECT_EQ(encodeText("hello world"), "aGVsbG8gd29ybGQ=");
}

TEST(WireCodec, Base64DecodeKnownVector) {
    auto bytes = base64Decode("aGVsbG8gd29ybGQ=");
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "hello world");
}

TEST(WireCodec, Base64RejectsGarbage) {
    EXPECT_THROW(base64Decode("TW*u"), DecodeError);
    EXPECT_THROW(base64Decode("TQ==TQ=="), DecodeError);
    EXPECT_THROW(base64Decode("T==="), DecodeError);
}

TEST(WireCodec, Base64RejectsIncompleteTrailingGroup) {
    EXPECT_THROW(base64Decode("TWFuT"), DecodeError);    // lone symbol
    EXPECT_THROW(base64Decode("TR=="), DecodeError);     // leftover bits set
    EXPECT_THROW(base64Decode("TWF"), DecodeError);      // leftover bits set
    EXPECT_THROW(base64Decode("TQ="), DecodeError);      // short padding

    auto ma = base64Decode("TWE");                       // unpadded but exact
    EXPECT_EQ(std::string(ma.begin(), ma.end()), "Ma");
}

TEST(WireCodec, FloatToPcm16ScalesAndClamps) {
    auto pcm = floatToPcm16({0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 3.0f, -3.0f});
    ASSERT_EQ(pcm.size(), 7u);
    EXPECT_EQ(pcm[0], 0);
    EXPECT_EQ(pcm[1], 16384);
    EXPECT_EQ(pcm[2], -16384);
    EXPECT_EQ(pcm[3], 32767);
    EXPECT_EQ(pcm[4], -32768);
    EXPECT_EQ(pcm[5], 32767);
    EXPECT_EQ(pcm[6], -32768);
}

TEST(WireCodec, Pcm16IsLittleEndian) {
    auto bytes = pcm16ToBytes({0x1234, -2});
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0x34);
    EXPECT_EQ(bytes[1], 0x12);
    EXPECT_EQ(bytes[2], 0xFE);
    EXPECT_EQ(bytes[3], 0xFF);
}

TEST(WireCodec, EncodeFrameCarriesRateInMimeType) {
    AudioFrame frame;
    frame.samples.assign(4096, 0.0f);
    auto chunk = encodeFrame(frame);
    EXPECT_EQ(chunk.mimeType, "audio/pcm;rate=16000");
    // 4096 samples * 2 bytes, base64 -> 4 chars per 3 bytes, padded
    EXPECT_EQ(chunk.data.size(), ((4096 * 2 + 2) / 3) * 4);
}

TEST(WireCodec, DecodeChunkScalesBy32768) {
    // 0x4000 = 16384, 0x8000 = -32768
    std::vector<std::uint8_t> raw{0x00, 0x40, 0x00, 0x80};
    auto buffer = decodeChunk(base64Encode(raw.data(), raw.size()), 24000, 1);
    ASSERT_EQ(buffer.samples.size(), 2u);
    EXPECT_FLOAT_EQ(buffer.samples[0], 0.5f);
    EXPECT_FLOAT_EQ(buffer.samples[1], -1.0f);
    EXPECT_EQ(buffer.sampleRate, 24000);
    EXPECT_EQ(buffer.frameCount(), 2u);
}

TEST(WireCodec, DecodeChunkKeepsChannelsInterleaved) {
    std::vector<std::uint8_t> raw(24000 * 2 * 2, 0);
    auto buffer = decodeChunk(base64Encode(raw.data(), raw.size()), 24000, 2);
    EXPECT_EQ(buffer.channels, 2);
    EXPECT_EQ(buffer.frameCount(), 24000u);
    EXPECT_DOUBLE_EQ(buffer.duration(), 1.0);
}

TEST(WireCodec, DecodeChunkRejectsMalformedPayloads) {
    std::vector<std::uint8_t> three{1, 2, 3};
    std::vector<std::uint8_t> two{1, 2};
    EXPECT_THROW(decodeChunk("", 24000, 1), DecodeError);
    EXPECT_THROW(decodeChunk("not base64!", 24000, 1), DecodeError);
    EXPECT_THROW(decodeChunk(base64Encode(three.data(), three.size()), 24000, 1), DecodeError);
    EXPECT_THROW(decodeChunk(base64Encode(two.data(), two.size()), 24000, 2), DecodeError);
    EXPECT_THROW(decodeChunk(base64Encode(two.data(), two.size()), 0, 1), DecodeError);
    EXPECT_THROW(decodeChunk(base64Encode(two.data(), two.size()), 24000, 0), DecodeError);
}

TEST(WireCodec, ResampleChangesLengthNotDuration) {
    PlaybackBuffer in;
    in.sampleRate = 16000;
    in.samples.assign(16000, 0.25f);

    auto out = resampleLinear(in, 24000);
    EXPECT_EQ(out.sampleRate, 24000);
    EXPECT_EQ(out.frameCount(), 24000u);
    EXPECT_NEAR(out.duration(), in.duration(), 1e-9);
    EXPECT_FLOAT_EQ(out.samples[12345], 0.25f);
}

TEST(WireCodec, ResampleIsIdentityAtSameRate) {
    PlaybackBuffer in;
    in.sampleRate = 24000;
    in.samples = {0.1f, 0.2f, 0.3f};
    auto out = resampleLinear(in, 24000);
    EXPECT_EQ(out.samples, in.samples);
}

TEST(WireCodec, RmsOfConstantSignal) {
    EXPECT_DOUBLE_EQ(rms({}), 0.0);
    EXPECT_NEAR(rms(std::vector<float>(100, 0.5f)), 0.5, 1e-9);
    EXPECT_NEAR(rms(std::vector<float>(100, -0.5f)), 0.5, 1e-9);
}
