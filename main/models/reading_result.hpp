#ifndef READING_RESULT_HPP
#define READING_RESULT_HPP

#include <cstdint>
#include <main/models/sensor_frame.hpp>

enum class ReadStatus : uint8_t {
    OK = 0,
    NO_RESPONSE = 1,        // line still high at the acknowledge check
    CHECKSUM_MISMATCH = 2,  // 40 bits received, integrity sum failed
    TIMEOUT = 3             // a line transition did not arrive in time mid-protocol
};

// Phases of one read transaction, in order
enum class ReadPhase : uint8_t {
    IDLE = 0,           // no transaction started; value of a zero-initialized result
    START_SIGNAL,
    AWAIT_ACK,
    SAMPLING,
    VALIDATING,
    DONE
};

// Outcome of one read. Lives for a single call.
struct ReadingResult {
    ReadStatus status;
    ReadPhase  phase;             // last phase entered; DONE on success
    float      value;             // converted quantity, only meaningful when status == OK
    SensorFrame frame;            // bytes as received (OK and CHECKSUM_MISMATCH)
    uint8_t    computed_checksum; // sum recomputed from the four data bytes
    uint8_t    bits_received;     // bits sampled before completion or timeout

    bool ok() const { return status == ReadStatus::OK; }
};

inline const char* toString(ReadStatus status) {
    switch (status) {
        case ReadStatus::OK:                return "OK";
        case ReadStatus::NO_RESPONSE:       return "NO_RESPONSE";
        case ReadStatus::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ReadStatus::TIMEOUT:           return "TIMEOUT";
    }
    return "UNKNOWN";
}

inline const char* toString(ReadPhase phase) {
    switch (phase) {
        case ReadPhase::IDLE:         return "IDLE";
        case ReadPhase::START_SIGNAL: return "START_SIGNAL";
        case ReadPhase::AWAIT_ACK:    return "AWAIT_ACK";
        case ReadPhase::SAMPLING:     return "SAMPLING";
        case ReadPhase::VALIDATING:   return "VALIDATING";
        case ReadPhase::DONE:         return "DONE";
    }
    return "UNKNOWN";
}

#endif // READING_RESULT_HPP
