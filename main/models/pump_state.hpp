#ifndef PUMP_STATE_HPP
#define PUMP_STATE_HPP

#include <cstdint>

enum class ControllerMode : uint8_t {
    AUTO = 0,
    MANUAL = 1
};

// Physical pump state plus the timestamp of the last transition into it.
// Only the timestamp matching is_on is meaningful; a transition stamps the
// entering state and clears the other one.
struct PumpActuator {
    bool     is_on;
    bool     has_on_since;
    uint32_t on_since_ms;
    bool     has_off_since;
    uint32_t off_since_ms;
};

// Start of a continuous "dry enough to water" condition
struct DebounceState {
    bool     dry_active;
    uint32_t dry_since_ms;
};

enum class PumpDecision : uint8_t {
    NONE = 0,
    TURN_ON = 1,          // dry window held, min-off elapsed, no lockout
    TURN_OFF_WET = 2,     // wet enough and min-on elapsed
    TURN_OFF_LOCKOUT = 3, // tank empty, overrides min-on
    MANUAL_ON = 4,
    MANUAL_OFF = 5
};

#endif // PUMP_STATE_HPP
