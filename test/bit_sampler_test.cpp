#include <gtest/gtest.h>
#include <vector>
#include <main/protocol/bit_sampler.hpp>
#include <main/protocol/single_wire_handshake.hpp>
#include "simulated_dht11_line.hpp"

namespace {

constexpr int kPin = 4;

RawBitFrame alternatingBits() {
    RawBitFrame bits = {};
    for (std::size_t i = 0; i < bits.size(); ++i) {
        bits[i] = (i % 3) == 0;
    }
    return bits;
}

// Waveform for the first n bits, then the line sticks at 'stuck_level'
std::vector<SimulatedDht11Line::Segment> truncatedWaveform(const RawBitFrame& bits, std::size_t n,
                                                           int stuck_level) {
    std::vector<SimulatedDht11Line::Segment> wave = SimulatedDht11Line::waveformFor(bits);
    // 3 handshake segments, then two per bit
    wave.resize(3 + 2 * n);
    wave.push_back({stuck_level, 1000000});
    return wave;
}

TEST(BitSamplerTest, RecoversExactBitSequence) {
    const RawBitFrame expected = alternatingBits();
    SimulatedDht11Line line(kPin);
    line.respondWithBits(expected);
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);

    RawBitFrame bits = {};
    uint8_t count = 0;
    ASSERT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::OK);
    EXPECT_EQ(count, 40);
    EXPECT_EQ(bits, expected);
}

TEST(BitSamplerTest, DecisionToleratesSlowReads) {
    // 3 us per read still lands the sample inside a one and after a zero
    const RawBitFrame expected = alternatingBits();
    SimulatedDht11Line line(kPin, 3);
    line.respondWithBits(expected);
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);

    RawBitFrame bits = {};
    uint8_t count = 0;
    ASSERT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::OK);
    EXPECT_EQ(bits, expected);
}

TEST(BitSamplerTest, SamplesTwentyEightMicrosecondsAfterEachRisingEdge) {
    SimulatedDht11Line line(kPin);
    line.respondWithBits(alternatingBits());
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);
    const std::size_t handshake_delays = line.microDelays().size();

    RawBitFrame bits = {};
    uint8_t count = 0;
    ASSERT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::OK);

    const std::vector<uint32_t>& delays = line.microDelays();
    ASSERT_EQ(delays.size() - handshake_delays, 40u);
    for (std::size_t i = handshake_delays; i < delays.size(); ++i) {
        EXPECT_EQ(delays[i], 28u) << "bit " << (i - handshake_delays);
    }
}

TEST(BitSamplerTest, ShortOnesStillReadAsOnes) {
    // A one only 32 us wide is still high at the 28 us sample point;
    // a later sample would see the next bit's lead-in instead.
    const RawBitFrame expected = alternatingBits();
    SimulatedDht11Line line(kPin);
    line.respondWith(SimulatedDht11Line::waveformFor(expected, 32));
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);

    RawBitFrame bits = {};
    uint8_t count = 0;
    ASSERT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::OK);
    EXPECT_EQ(bits, expected);
}

TEST(BitSamplerTest, TimeoutWhenLineSticksLowMidFrame) {
    SimulatedDht11Line line(kPin);
    line.respondWith(truncatedWaveform(alternatingBits(), 10, 0));
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);

    RawBitFrame bits = {};
    uint8_t count = 0;
    EXPECT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::TIMEOUT);
    EXPECT_EQ(count, 10);
}

TEST(BitSamplerTest, TimeoutWhenLineSticksHighMidFrame) {
    SimulatedDht11Line line(kPin);
    line.respondWith(truncatedWaveform(alternatingBits(), 25, 1));
    ASSERT_EQ(SingleWireHandshake::perform(line, kPin), HandshakeStatus::ACK);

    RawBitFrame bits = {};
    uint8_t count = 0;
    EXPECT_EQ(BitSampler::sample(line, kPin, bits, count), SampleStatus::TIMEOUT);
    EXPECT_EQ(count, 25);
}

} // namespace
