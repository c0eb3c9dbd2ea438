#include <main/protocol/single_wire_handshake.hpp>
#include <main/protocol/line_wait.hpp>
#include <main/config/dht_timing.hpp>

namespace SingleWireHandshake {
    void sendStartSignal(PinTransport& transport, int pin) {
        transport.digitalWrite(pin, 0);
        transport.delayMilliseconds(Config::Dht::start_signal_ms);
    }

    HandshakeStatus awaitAck(PinTransport& transport, int pin) {
        transport.setPullMode(pin, PullMode::PULL_UP);
        // Discard the first read after switching to input
        (void)transport.digitalRead(pin);

        transport.delayMicroseconds(Config::Dht::ack_check_delay_us);
        if (transport.digitalRead(pin) != 0) {
            return HandshakeStatus::NO_RESPONSE;
        }

        if (!LineWait::whileLevel(transport, pin, 0, Config::Dht::edge_timeout_us)) {
            return HandshakeStatus::TIMEOUT;
        }
        if (!LineWait::whileLevel(transport, pin, 1, Config::Dht::edge_timeout_us)) {
            return HandshakeStatus::TIMEOUT;
        }
        return HandshakeStatus::ACK;
    }

    HandshakeStatus perform(PinTransport& transport, int pin) {
        sendStartSignal(transport, pin);
        return awaitAck(transport, pin);
    }
}
