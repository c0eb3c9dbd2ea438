#ifndef PIN_TRANSPORT_HPP
#define PIN_TRANSPORT_HPP

#include <cstdint>

enum class PullMode : uint8_t {
    FLOATING = 0,
    PULL_UP  = 1,
    PULL_DOWN = 2
};

// Pin-level capability consumed by the single-wire protocol.
// The protocol never touches hardware registers itself; the firmware injects
// an ESP32 GPIO implementation and the host tests inject a simulated line.
//
// Semantics expected by the protocol:
// - digitalWrite() switches the pin to output and drives the given level.
// - setPullMode() switches the pin to input with the given pull; PULL_UP
//   releases the line to the sensor.
// - digitalRead() returns 0 or 1.
// - micros() is a monotonic microsecond timestamp used for wait deadlines.
class PinTransport {
public:
    virtual ~PinTransport() = default;

    virtual void digitalWrite(int pin, int level) = 0;
    virtual int digitalRead(int pin) = 0;
    virtual void setPullMode(int pin, PullMode mode) = 0;

    virtual void delayMicroseconds(uint32_t us) = 0;
    virtual void delayMilliseconds(uint32_t ms) = 0;
    virtual uint64_t micros() = 0;

    // Bracket the microsecond-sensitive part of a transaction. Nothing
    // inside may call delayMilliseconds().
    virtual void enterTimingCritical() {}
    virtual void exitTimingCritical() {}
};

// Scoped enter/exit of the transport's timing-critical window
class TimingCriticalSection {
public:
    explicit TimingCriticalSection(PinTransport& transport_in) : transport(transport_in) {
        transport.enterTimingCritical();
    }
    ~TimingCriticalSection() {
        transport.exitTimingCritical();
    }

    TimingCriticalSection(const TimingCriticalSection&) = delete;
    TimingCriticalSection& operator=(const TimingCriticalSection&) = delete;

private:
    PinTransport& transport;
};

#endif // PIN_TRANSPORT_HPP
