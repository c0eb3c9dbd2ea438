#include <main/protocol/line_wait.hpp>

namespace LineWait {
    bool whileLevel(PinTransport& transport, int pin, int level, uint32_t timeout_us) {
        const uint64_t start_us = transport.micros();
        while (transport.digitalRead(pin) == level) {
            if (transport.micros() - start_us > timeout_us) {
                return false;
            }
        }
        return true;
    }
}
