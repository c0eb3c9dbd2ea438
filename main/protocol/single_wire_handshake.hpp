#ifndef SINGLE_WIRE_HANDSHAKE_HPP
#define SINGLE_WIRE_HANDSHAKE_HPP

#include <cstdint>
#include <main/hardware/pin_transport.hpp>

enum class HandshakeStatus : uint8_t {
    ACK = 0,
    NO_RESPONSE = 1,  // line was high at the acknowledge check
    TIMEOUT = 2       // acknowledge pulse started but never completed
};

// Start condition and acknowledge of the DHT11 single-wire protocol.
//
//   host:   ‾‾‾\____ >=18 ms ____/‾‾ (released, pull-up)
//   sensor:                         ‾‾\__ 80 us __/‾‾ 80 us ‾‾\__ data...
//
namespace SingleWireHandshake {
    // Hold the line low for the wake-up period. The line is left driven low.
    // Uses a millisecond delay; call outside the timing-critical window.
    void sendStartSignal(PinTransport& transport, int pin);

    // Release the line to the pull-up, check for the sensor pulling it low and
    // consume the 80 us low / 80 us high acknowledge. Everything from the
    // release on is microsecond-sensitive. On ACK the line is at the first
    // bit's low lead-in; on any result the line is released.
    HandshakeStatus awaitAck(PinTransport& transport, int pin);

    // sendStartSignal() followed by awaitAck()
    HandshakeStatus perform(PinTransport& transport, int pin);
}

#endif // SINGLE_WIRE_HANDSHAKE_HPP
