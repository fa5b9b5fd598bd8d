#include <main/control/hysteresis.hpp>

namespace {
    static bool minOnElapsed(const PumpActuator& pump, uint32_t now_ms, uint32_t min_on_ms) {
        if (!pump.has_on_since) {
            return true;
        }
        return Hysteresis::elapsedMs(now_ms, pump.on_since_ms) >= min_on_ms;
    }

    // No recorded stop (fresh boot) counts as rested
    static bool minOffElapsed(const PumpActuator& pump, uint32_t now_ms, uint32_t min_off_ms) {
        if (!pump.has_off_since) {
            return true;
        }
        return Hysteresis::elapsedMs(now_ms, pump.off_since_ms) >= min_off_ms;
    }
}

namespace Hysteresis {
    PumpDecision evaluateLockoutOnly(const PumpActuator& pump, bool lockout) {
        if (pump.is_on && lockout) {
            return PumpDecision::TURN_OFF_LOCKOUT;
        }
        return PumpDecision::NONE;
    }

    PumpDecision evaluate(const PumpActuator& pump,
                          DebounceState& debounce,
                          uint8_t percent,
                          bool lockout,
                          uint32_t now_ms,
                          const ControlThresholds& t) {
        if (pump.is_on) {
            debounce.dry_active = false;
            if (lockout) {
                return PumpDecision::TURN_OFF_LOCKOUT;
            }
            if (percent >= t.off_percent && minOnElapsed(pump, now_ms, t.min_on_ms)) {
                return PumpDecision::TURN_OFF_WET;
            }
            return PumpDecision::NONE;
        }

        // Dry window tracks moisture only; lockout gates the transition below
        const bool dry = percent <= t.on_percent;
        if (!dry) {
            debounce.dry_active = false;
            return PumpDecision::NONE;
        }
        if (!debounce.dry_active) {
            debounce.dry_active = true;
            debounce.dry_since_ms = now_ms;
        }

        if (lockout) {
            return PumpDecision::NONE;
        }
        if (elapsedMs(now_ms, debounce.dry_since_ms) < t.dry_hold_ms) {
            return PumpDecision::NONE;
        }
        if (!minOffElapsed(pump, now_ms, t.min_off_ms)) {
            return PumpDecision::NONE;
        }
        return PumpDecision::TURN_ON;
    }
}
