#include <main/protocol/frame_decoder.hpp>

namespace FrameDecoder {
    uint8_t packByte(const RawBitFrame& bits, std::size_t offset) {
        uint8_t value = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            value = static_cast<uint8_t>(value << 1);
            if (bits[offset + i]) {
                value |= 1u;
            }
        }
        return value;
    }

    uint8_t computeChecksum(const SensorFrame& frame) {
        const uint32_t sum = static_cast<uint32_t>(frame.humidity_integer) +
                             frame.humidity_fraction +
                             frame.temperature_integer +
                             frame.temperature_fraction;
        return static_cast<uint8_t>(sum & 0xFFu);
    }

    DecodeStatus decode(const RawBitFrame& bits, SensorFrame& out_frame) {
        out_frame.humidity_integer     = packByte(bits, 0);
        out_frame.humidity_fraction    = packByte(bits, 8);
        out_frame.temperature_integer  = packByte(bits, 16);
        out_frame.temperature_fraction = packByte(bits, 24);
        out_frame.checksum             = packByte(bits, 32);

        if (computeChecksum(out_frame) != out_frame.checksum) {
            return DecodeStatus::CHECKSUM_MISMATCH;
        }
        return DecodeStatus::OK;
    }
}
