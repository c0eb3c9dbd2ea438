#ifndef CLIMATE_DATA_HPP
#define CLIMATE_DATA_HPP

#include <cstdint>

// Fixed-size combined sample from one DHT11 read
struct ClimateData {
    float     temp_c;       // temperature in Celsius
    float     humidity_pct; // relative humidity 0..100
    uint32_t  ts_ms;        // sample timestamp in milliseconds
};

#endif // CLIMATE_DATA_HPP
