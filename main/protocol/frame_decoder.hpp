#ifndef FRAME_DECODER_HPP
#define FRAME_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/sensor_frame.hpp>

enum class DecodeStatus : uint8_t {
    OK = 0,
    CHECKSUM_MISMATCH = 1
};

namespace FrameDecoder {
    // Pack bits [offset, offset + 8) into a byte, first bit most significant
    uint8_t packByte(const RawBitFrame& bits, std::size_t offset);

    // Low byte of the sum of the four data fields
    uint8_t computeChecksum(const SensorFrame& frame);

    // Split the 40 bits into the five fields and verify the checksum.
    // out_frame is filled in both cases so a mismatch can be reported
    // with the bytes actually received.
    DecodeStatus decode(const RawBitFrame& bits, SensorFrame& out_frame);
}

#endif // FRAME_DECODER_HPP
