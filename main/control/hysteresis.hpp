#ifndef HYSTERESIS_HPP
#define HYSTERESIS_HPP

#include <cstdint>
#include <main/models/pump_state.hpp>
#include <main/control/control_thresholds.hpp>

// Pump ON/OFF decision for AUTO mode.
//
//   OFF -> ON   lockout clear, percent <= on_percent held for dry_hold_ms,
//               and min_off_ms since the pump last stopped
//   ON  -> OFF  percent >= off_percent once min_on_ms has elapsed, or
//               lockout at any time (min_on_ms is not honoured)
//
// Nothing happens while percent sits strictly inside (on_percent, off_percent).
namespace Hysteresis {
    // Updates the dry window in debounce and returns the transition to apply.
    // The caller applies the transition and clears debounce when it does.
    PumpDecision evaluate(const PumpActuator& pump,
                          DebounceState& debounce,
                          uint8_t percent,
                          bool lockout,
                          uint32_t now_ms,
                          const ControlThresholds& t);

    // Only the lockout override; used when the tick has no soil sample
    PumpDecision evaluateLockoutOnly(const PumpActuator& pump, bool lockout);

    // Wrap-safe elapsed time on the 32-bit millisecond clock
    inline uint32_t elapsedMs(uint32_t now_ms, uint32_t since_ms) {
        return now_ms - since_ms;
    }
}

#endif // HYSTERESIS_HPP
