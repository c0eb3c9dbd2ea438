#include <main/hardware/dht11_sensor.hpp>
#include <main/protocol/single_wire_handshake.hpp>
#include <main/protocol/bit_sampler.hpp>
#include <main/protocol/frame_decoder.hpp>
#include <main/protocol/reading_converter.hpp>

Dht11Sensor::Dht11Sensor(PinTransport& transport_in, int data_pin)
    : transport(transport_in), pin(data_pin) {}

ReadingResult Dht11Sensor::readFrame() {
    ReadingResult result = {};
    result.status = ReadStatus::OK;
    result.phase = ReadPhase::START_SIGNAL;

    SingleWireHandshake::sendStartSignal(transport, pin);

    RawBitFrame bits = {};
    {
        // Release, acknowledge and all 40 bits must not be preempted
        TimingCriticalSection critical(transport);

        result.phase = ReadPhase::AWAIT_ACK;
        HandshakeStatus ack = SingleWireHandshake::awaitAck(transport, pin);
        if (ack == HandshakeStatus::NO_RESPONSE) {
            result.status = ReadStatus::NO_RESPONSE;
            return result;
        }
        if (ack == HandshakeStatus::TIMEOUT) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }

        result.phase = ReadPhase::SAMPLING;
        if (BitSampler::sample(transport, pin, bits, result.bits_received) != SampleStatus::OK) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }
    }

    result.phase = ReadPhase::VALIDATING;
    DecodeStatus decoded = FrameDecoder::decode(bits, result.frame);
    result.computed_checksum = FrameDecoder::computeChecksum(result.frame);
    if (decoded != DecodeStatus::OK) {
        result.status = ReadStatus::CHECKSUM_MISMATCH;
        return result;
    }

    result.phase = ReadPhase::DONE;
    return result;
}

ReadingResult Dht11Sensor::readTemperature(TemperatureScale scale) {
    ReadingResult result = readFrame();
    if (result.ok()) {
        result.value = ReadingConverter::toTemperature(result.frame, scale);
    }
    return result;
}

ReadingResult Dht11Sensor::readHumidity() {
    ReadingResult result = readFrame();
    if (result.ok()) {
        result.value = ReadingConverter::toHumidity(result.frame);
    }
    return result;
}

bool Dht11Sensor::readTemperature(TemperatureScale scale, float& out_value) {
    ReadingResult result = readTemperature(scale);
    if (!result.ok()) {
        return false;
    }
    out_value = result.value;
    return true;
}

bool Dht11Sensor::readHumidity(float& out_value) {
    ReadingResult result = readHumidity();
    if (!result.ok()) {
        return false;
    }
    out_value = result.value;
    return true;
}

namespace Dht11 {
    float toSentinel(const ReadingResult& result) {
        switch (result.status) {
            case ReadStatus::OK:                return result.value;
            case ReadStatus::NO_RESPONSE:       return NO_RESPONSE_VALUE;
            case ReadStatus::CHECKSUM_MISMATCH: return CHECKSUM_MISMATCH_VALUE;
            case ReadStatus::TIMEOUT:           return TIMEOUT_VALUE;
        }
        return TIMEOUT_VALUE;
    }

    float readTemperature(PinTransport& transport, int pin, TemperatureScale scale) {
        Dht11Sensor sensor(transport, pin);
        return toSentinel(sensor.readTemperature(scale));
    }

    float readHumidity(PinTransport& transport, int pin) {
        Dht11Sensor sensor(transport, pin);
        return toSentinel(sensor.readHumidity());
    }
}
