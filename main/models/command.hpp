#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <cstdint>

enum class CommandType : int32_t {
    NONE = 0,
    SET_PUMP = 1,             // value: 1 = on, 0 = off
    SET_MODE = 2,             // value: ControllerMode
    SET_LEGACY_THRESHOLD = 3  // value: raw ADC count, display only
};

// Fixed-size command container for inter-task messaging
struct Command {
    uint32_t    timestamp_ms; // time command was received
    CommandType type;
    int32_t     value;
    char        request_id[24]; // echoed in the acknowledgement, may be empty
};

#endif // COMMAND_HPP
