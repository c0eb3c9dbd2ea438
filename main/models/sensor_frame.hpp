#ifndef SENSOR_FRAME_HPP
#define SENSOR_FRAME_HPP

#include <array>
#include <cstdint>
#include <main/config/dht_timing.hpp>

// Bits as received from the line; index 0 is the first (most significant) bit
using RawBitFrame = std::array<bool, Config::Dht::frame_bits>;

// The five payload bytes of one DHT11 transmission
struct SensorFrame {
    uint8_t humidity_integer;
    uint8_t humidity_fraction;
    uint8_t temperature_integer;
    uint8_t temperature_fraction;
    uint8_t checksum;              // low byte of the sum of the four fields above
};

enum class TemperatureScale : uint8_t {
    CELSIUS = 0,
    FAHRENHEIT = 1,
    KELVIN = 2
};

#endif // SENSOR_FRAME_HPP
