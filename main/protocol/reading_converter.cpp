#include <main/protocol/reading_converter.hpp>

static constexpr float KELVIN_OFFSET = 273.15f;

namespace ReadingConverter {
    float toCelsius(const SensorFrame& frame) {
        return static_cast<float>(frame.temperature_integer) +
               static_cast<float>(frame.temperature_fraction) / 100.0f;
    }

    float fromCelsius(float celsius, TemperatureScale scale) {
        switch (scale) {
            case TemperatureScale::FAHRENHEIT:
                return celsius * 9.0f / 5.0f + 32.0f;
            case TemperatureScale::KELVIN:
                return celsius + KELVIN_OFFSET;
            case TemperatureScale::CELSIUS:
            default:
                return celsius;
        }
    }

    float toTemperature(const SensorFrame& frame, TemperatureScale scale) {
        return fromCelsius(toCelsius(frame), scale);
    }

    float toHumidity(const SensorFrame& frame) {
        return static_cast<float>(frame.humidity_integer) +
               static_cast<float>(frame.humidity_fraction) / 100.0f;
    }
}
