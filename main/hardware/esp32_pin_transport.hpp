#ifndef ESP32_PIN_TRANSPORT_HPP
#define ESP32_PIN_TRANSPORT_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <esp_err.h>
#include <freertos/FreeRTOS.h>
#include <main/hardware/pin_transport.hpp>

// PinTransport over the ESP32 GPIO matrix.
// Microsecond delays spin on the ROM delay, timestamps come from esp_timer,
// millisecond delays yield to the scheduler. The timing-critical window is a
// FreeRTOS critical section (interrupts masked on the calling core).
class Esp32PinTransport : public PinTransport {
public:
    explicit Esp32PinTransport(gpio_num_t pin);

    // Configure the pin as a released input with pull-up; returns false on driver error
    bool init();

    void digitalWrite(int pin, int level) override;
    int digitalRead(int pin) override;
    void setPullMode(int pin, PullMode mode) override;

    void delayMicroseconds(uint32_t us) override;
    void delayMilliseconds(uint32_t ms) override;
    uint64_t micros() override;

    void enterTimingCritical() override;
    void exitTimingCritical() override;

    // First GPIO driver error since the last call (ESP_OK if none); clears it.
    // Driver calls can happen inside the critical section where logging is
    // not allowed, so failures are latched and reported by the caller.
    esp_err_t takeError();

private:
    inline void latch(esp_err_t err);

    gpio_num_t pin;
    esp_err_t pending_error;
    portMUX_TYPE mux = portMUX_INITIALIZER_UNLOCKED;
};

#endif // ESP32_PIN_TRANSPORT_HPP
