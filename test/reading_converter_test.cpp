#include <gtest/gtest.h>
#include <main/protocol/reading_converter.hpp>

namespace {

SensorFrame frameOf(uint8_t hi, uint8_t hf, uint8_t ti, uint8_t tf) {
    SensorFrame frame = {};
    frame.humidity_integer = hi;
    frame.humidity_fraction = hf;
    frame.temperature_integer = ti;
    frame.temperature_fraction = tf;
    frame.checksum = static_cast<uint8_t>(hi + hf + ti + tf);
    return frame;
}

TEST(ReadingConverterTest, FreezingAndBoilingPoints) {
    EXPECT_FLOAT_EQ(ReadingConverter::fromCelsius(0.0f, TemperatureScale::FAHRENHEIT), 32.0f);
    EXPECT_FLOAT_EQ(ReadingConverter::fromCelsius(0.0f, TemperatureScale::KELVIN), 273.15f);
    EXPECT_FLOAT_EQ(ReadingConverter::fromCelsius(100.0f, TemperatureScale::FAHRENHEIT), 212.0f);
    EXPECT_FLOAT_EQ(ReadingConverter::fromCelsius(21.0f, TemperatureScale::CELSIUS), 21.0f);
}

TEST(ReadingConverterTest, TemperatureFromFrame) {
    const SensorFrame frame = frameOf(45, 0, 23, 50);
    EXPECT_FLOAT_EQ(ReadingConverter::toTemperature(frame, TemperatureScale::CELSIUS), 23.5f);
    EXPECT_NEAR(ReadingConverter::toTemperature(frame, TemperatureScale::FAHRENHEIT), 74.3f, 0.01f);
    EXPECT_NEAR(ReadingConverter::toTemperature(frame, TemperatureScale::KELVIN), 296.65f, 0.001f);
}

TEST(ReadingConverterTest, HumidityFromFrame) {
    EXPECT_FLOAT_EQ(ReadingConverter::toHumidity(frameOf(45, 0, 23, 50)), 45.0f);
    EXPECT_NEAR(ReadingConverter::toHumidity(frameOf(61, 25, 0, 0)), 61.25f, 1e-4f);
}

TEST(ReadingConverterTest, FractionIsHundredths) {
    EXPECT_NEAR(ReadingConverter::toCelsius(frameOf(0, 0, 19, 7)), 19.07f, 1e-4f);
    EXPECT_NEAR(ReadingConverter::toCelsius(frameOf(0, 0, 0, 99)), 0.99f, 1e-4f);
}

} // namespace
