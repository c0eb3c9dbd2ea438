#include <main/protocol/bit_sampler.hpp>
#include <main/protocol/line_wait.hpp>
#include <main/config/dht_timing.hpp>

namespace BitSampler {
    SampleStatus sample(PinTransport& transport, int pin,
                        RawBitFrame& out_bits, uint8_t& out_bits_read) {
        out_bits.fill(false);
        out_bits_read = 0;

        for (uint8_t i = 0; i < Config::Dht::frame_bits; ++i) {
            // Tail of the previous bit's high pulse (no-op for zeros and the first bit)
            if (!LineWait::whileLevel(transport, pin, 1, Config::Dht::edge_timeout_us)) {
                return SampleStatus::TIMEOUT;
            }
            // Low lead-in
            if (!LineWait::whileLevel(transport, pin, 0, Config::Dht::edge_timeout_us)) {
                return SampleStatus::TIMEOUT;
            }

            transport.delayMicroseconds(Config::Dht::bit_sample_delay_us);
            out_bits[i] = (transport.digitalRead(pin) != 0);
            out_bits_read = static_cast<uint8_t>(i + 1);
        }
        return SampleStatus::OK;
    }
}
