#ifndef DHT11_SENSOR_HPP
#define DHT11_SENSOR_HPP

#include <cstdint>
#include <main/hardware/pin_transport.hpp>
#include <main/models/reading_result.hpp>
#include <main/models/sensor_frame.hpp>

// DHT11 temperature/humidity sensor on a bit-banged single-wire line.
//
// Every read is a complete, blocking transaction:
//   START_SIGNAL -> AWAIT_ACK -> SAMPLING -> VALIDATING -> DONE
// and nothing is kept between calls, so a failed read leaves the reader and
// the (released) line ready for the next attempt. Retrying is up to the caller;
// allow at least one second between transactions.
class Dht11Sensor {
public:
    Dht11Sensor(PinTransport& transport, int data_pin);

    // Run one transaction and return the validated frame (value is 0)
    ReadingResult readFrame();

    // Run one transaction and convert to the requested quantity
    ReadingResult readTemperature(TemperatureScale scale = TemperatureScale::CELSIUS);
    ReadingResult readHumidity();

    // Same as above with a separate success indicator; out value is untouched on failure
    bool readTemperature(TemperatureScale scale, float& out_value);
    bool readHumidity(float& out_value);


private:
    PinTransport& transport;
    int pin;
};

// Float API with in-band error values. A real DHT11 never reports below
// 0 °C, so the negative sentinels cannot collide with a reading.
namespace Dht11 {
    static constexpr float NO_RESPONSE_VALUE       = -1.0f;
    static constexpr float TIMEOUT_VALUE           = -2.0f;
    static constexpr float CHECKSUM_MISMATCH_VALUE = -999.0f;

    // Converted value, or one of the sentinels above
    float readTemperature(PinTransport& transport, int pin, TemperatureScale scale);
    float readHumidity(PinTransport& transport, int pin);

    // Sentinel for a failed status; value itself when status is OK
    float toSentinel(const ReadingResult& result);
}

#endif // DHT11_SENSOR_HPP
