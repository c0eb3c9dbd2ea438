#ifndef LINE_WAIT_HPP
#define LINE_WAIT_HPP

#include <cstdint>
#include <main/hardware/pin_transport.hpp>

namespace LineWait {
    // Busy-wait while the pin reads 'level'. Returns false if the level is
    // still present after timeout_us (measured with transport.micros()).
    bool whileLevel(PinTransport& transport, int pin, int level, uint32_t timeout_us);
}

#endif // LINE_WAIT_HPP
