#ifndef BIT_SAMPLER_HPP
#define BIT_SAMPLER_HPP

#include <cstdint>
#include <main/hardware/pin_transport.hpp>
#include <main/models/sensor_frame.hpp>

enum class SampleStatus : uint8_t {
    OK = 0,
    TIMEOUT = 1
};

// Each DHT11 bit is a ~50 us low lead-in followed by a high pulse whose
// width carries the value: ~26-28 us for 0, ~70 us for 1. The line is
// sampled a fixed delay after the rising edge.
namespace BitSampler {
    // Read the 40 payload bits. Call only after the handshake returned ACK.
    // out_bits_read holds the number of bits completed, also on TIMEOUT.
    SampleStatus sample(PinTransport& transport, int pin,
                        RawBitFrame& out_bits, uint8_t& out_bits_read);
}

#endif // BIT_SAMPLER_HPP
