#ifndef READING_CONVERTER_HPP
#define READING_CONVERTER_HPP

#include <main/models/sensor_frame.hpp>

// Unit conversion for validated frames. The fraction bytes are hundredths.
namespace ReadingConverter {
    float toCelsius(const SensorFrame& frame);
    float fromCelsius(float celsius, TemperatureScale scale);
    float toTemperature(const SensorFrame& frame, TemperatureScale scale);

    // Relative humidity in percent
    float toHumidity(const SensorFrame& frame);
}

#endif // READING_CONVERTER_HPP
