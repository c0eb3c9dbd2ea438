#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <main/protocol/frame_decoder.hpp>
#include "simulated_dht11_line.hpp"

namespace {

RawBitFrame bitsOf(const std::array<uint8_t, 5>& bytes) {
    return SimulatedDht11Line::bitsFromBytes(bytes);
}

TEST(FrameDecoderTest, PacksFieldsMostSignificantBitFirst) {
    SensorFrame frame = {};
    ASSERT_EQ(FrameDecoder::decode(bitsOf({45, 0, 23, 50, 118}), frame), DecodeStatus::OK);
    EXPECT_EQ(frame.humidity_integer, 45);
    EXPECT_EQ(frame.humidity_fraction, 0);
    EXPECT_EQ(frame.temperature_integer, 23);
    EXPECT_EQ(frame.temperature_fraction, 50);
    EXPECT_EQ(frame.checksum, 118);
}

TEST(FrameDecoderTest, PackByteTreatsFirstBitAsMsb) {
    RawBitFrame bits = {};
    bits[8] = true;   // MSB of the second byte
    bits[15] = true;  // LSB of the second byte
    EXPECT_EQ(FrameDecoder::packByte(bits, 0), 0x00);
    EXPECT_EQ(FrameDecoder::packByte(bits, 8), 0x81);
}

TEST(FrameDecoderTest, ChecksumWrapsModulo256) {
    // 200 + 90 + 30 + 99 = 419 -> 0xa3
    SensorFrame frame = {};
    EXPECT_EQ(FrameDecoder::decode(bitsOf({200, 90, 30, 99, 163}), frame), DecodeStatus::OK);
    EXPECT_EQ(FrameDecoder::computeChecksum(frame), 163);
}

TEST(FrameDecoderTest, MismatchStillReportsReceivedBytes) {
    SensorFrame frame = {};
    EXPECT_EQ(FrameDecoder::decode(bitsOf({45, 0, 23, 50, 119}), frame),
              DecodeStatus::CHECKSUM_MISMATCH);
    EXPECT_EQ(frame.humidity_integer, 45);
    EXPECT_EQ(frame.temperature_fraction, 50);
    EXPECT_EQ(frame.checksum, 119);
    EXPECT_EQ(FrameDecoder::computeChecksum(frame), 118);
}

TEST(FrameDecoderTest, DetectsEverySingleBitFlipInDataBytes) {
    const std::array<std::array<uint8_t, 5>, 3> frames = {{
        {45, 0, 23, 50, 118},
        {200, 90, 30, 99, 163},
        {0, 0, 0, 0, 0},
    }};
    for (const auto& bytes : frames) {
        const RawBitFrame good = bitsOf(bytes);
        SensorFrame frame = {};
        ASSERT_EQ(FrameDecoder::decode(good, frame), DecodeStatus::OK);

        for (std::size_t i = 0; i < 32; ++i) {
            RawBitFrame corrupt = good;
            corrupt[i] = !corrupt[i];
            EXPECT_EQ(FrameDecoder::decode(corrupt, frame), DecodeStatus::CHECKSUM_MISMATCH)
                << "bit " << i << " of frame starting " << static_cast<int>(bytes[0]);
        }
    }
}

TEST(FrameDecoderTest, ReversedBitOrderDecodesDifferently) {
    const RawBitFrame bits = bitsOf({45, 0, 23, 50, 118});
    RawBitFrame reversed = bits;
    std::reverse(reversed.begin(), reversed.end());

    SensorFrame forward = {};
    SensorFrame backward = {};
    (void)FrameDecoder::decode(bits, forward);
    (void)FrameDecoder::decode(reversed, backward);

    const bool same = forward.humidity_integer == backward.humidity_integer &&
                      forward.humidity_fraction == backward.humidity_fraction &&
                      forward.temperature_integer == backward.temperature_integer &&
                      forward.temperature_fraction == backward.temperature_fraction &&
                      forward.checksum == backward.checksum;
    EXPECT_FALSE(same);
    // First byte is now the checksum 118 (0b01110110) read backwards
    EXPECT_EQ(backward.humidity_integer, 0x6E);
}

} // namespace
