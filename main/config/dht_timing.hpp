#ifndef DHT_TIMING_HPP
#define DHT_TIMING_HPP

#include <cstdint>

// DHT11 single-wire protocol timings. Kept free of ESP-IDF headers so the
// protocol core builds for host tests as well as for the target.
namespace Config {
namespace Dht {
    // Start condition: host holds the line low at least this long to wake the sensor
    static constexpr uint32_t start_signal_ms = 18;

    // Delay after releasing the line before checking for the acknowledge low
    static constexpr uint32_t ack_check_delay_us = 40;

    // Delay after a bit's rising edge before sampling.
    // Zero = ~26-28 us high, one = ~70 us high.
    static constexpr uint32_t bit_sample_delay_us = 28;

    // Upper bound for any single wait on a line transition. Longest legal
    // phase is the 80 us acknowledge pulse.
    static constexpr uint32_t edge_timeout_us = 200;

    // Payload: humidity int/frac, temperature int/frac, checksum
    static constexpr uint8_t frame_bytes = 5;
    static constexpr uint8_t frame_bits = frame_bytes * 8;
}
}

#endif // DHT_TIMING_HPP
