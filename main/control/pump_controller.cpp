#include <main/control/pump_controller.hpp>
#include <main/control/hysteresis.hpp>
#include <main/control/tank_monitor.hpp>

PumpController::PumpController(const ControlThresholds& thresholds, PumpOutput* out)
    : cfg(thresholds), output(out), st{} {}

void PumpController::begin(uint32_t now_ms, uint16_t legacy_threshold_raw) {
    st = ControllerState{};
    st.mode = ControllerMode::AUTO;
    st.pump.is_on = false;
    st.legacy_threshold_raw = legacy_threshold_raw;
    st.last_decision = PumpDecision::NONE;
    st.boot_ms = now_ms;
    if (output != nullptr) {
        output->drive(false);
    }
}

TickResult PumpController::tick(uint32_t now_ms, const TickInputs& inputs) {
    TickResult result{};
    result.decision = PumpDecision::NONE;

    if (inputs.has_soil) {
        st.soil = inputs.soil;
        st.has_soil = true;
    }
    st.tank = inputs.tank;
    st.has_tank = true;

    const bool lockout = TankMonitor::deriveLockout(inputs.tank, st.lockout, cfg);
    result.lockout_changed = (lockout != st.lockout);
    st.lockout = lockout;

    if (st.mode != ControllerMode::AUTO) {
        result.evaluated = false;
        return result;
    }
    result.evaluated = true;

    PumpDecision decision;
    if (inputs.has_soil) {
        decision = Hysteresis::evaluate(st.pump, st.debounce, inputs.soil.percent,
                                        lockout, now_ms, cfg);
    } else {
        // Without a reading the dry window is no longer continuous
        st.debounce.dry_active = false;
        decision = Hysteresis::evaluateLockoutOnly(st.pump, lockout);
    }

    if (decision != PumpDecision::NONE) {
        apply(decision, now_ms);
    }
    result.decision = decision;
    return result;
}

PumpDecision PumpController::setManual(bool on, uint32_t now_ms) {
    st.mode = ControllerMode::MANUAL;
    if (st.pump.is_on == on) {
        return PumpDecision::NONE;
    }
    const PumpDecision decision = on ? PumpDecision::MANUAL_ON : PumpDecision::MANUAL_OFF;
    apply(decision, now_ms);
    return decision;
}

bool PumpController::setMode(ControllerMode mode) {
    if (st.mode == mode) {
        return false;
    }
    st.mode = mode;
    st.debounce.dry_active = false;
    return true;
}

void PumpController::setLegacyThreshold(uint16_t raw) {
    st.legacy_threshold_raw = raw;
}

void PumpController::apply(PumpDecision decision, uint32_t now_ms) {
    const bool turn_on = (decision == PumpDecision::TURN_ON || decision == PumpDecision::MANUAL_ON);

    st.pump.is_on = turn_on;
    if (turn_on) {
        st.pump.has_on_since = true;
        st.pump.on_since_ms = now_ms;
        st.pump.has_off_since = false;
        st.pump.off_since_ms = 0;
    } else {
        st.pump.has_off_since = true;
        st.pump.off_since_ms = now_ms;
        st.pump.has_on_since = false;
        st.pump.on_since_ms = 0;
    }
    st.debounce.dry_active = false;
    st.debounce.dry_since_ms = 0;
    st.last_decision = decision;
    ++st.transitions;

    if (output != nullptr) {
        output->drive(turn_on);
    }
}

TelemetrySnapshot PumpController::snapshot(uint32_t now_ms) const {
    TelemetrySnapshot s{};
    s.has_soil = st.has_soil;
    if (st.has_soil) {
        s.soil_raw = st.soil.raw;
        s.soil_smoothed = st.soil.smoothed;
        s.soil_percent = st.soil.percent;
    }

    s.has_tank_distance = st.has_tank && st.tank.has_distance;
    if (s.has_tank_distance) {
        s.tank_distance_cm = st.tank.distance_cm;
    }
    s.tank_valid_samples = st.has_tank ? st.tank.valid_samples : 0;
    const TankMonitor::TankLevel lvl = TankMonitor::level(st.tank, cfg.tank_height_cm, cfg.tank_radius_cm);
    s.tank_capacity_cm3 = lvl.capacity_cm3;
    if (s.has_tank_distance && lvl.valid) {
        s.tank_level_percent = lvl.percent;
        s.tank_volume_cm3 = lvl.volume_cm3;
    }

    s.lockout = st.lockout;
    s.pump_on = st.pump.is_on;
    s.mode = st.mode;
    uint32_t since = st.boot_ms;
    if (st.pump.is_on && st.pump.has_on_since) {
        since = st.pump.on_since_ms;
    } else if (!st.pump.is_on && st.pump.has_off_since) {
        since = st.pump.off_since_ms;
    }
    s.pump_state_ms = Hysteresis::elapsedMs(now_ms, since);
    s.last_decision = st.last_decision;
    s.transitions = st.transitions;
    s.legacy_threshold_raw = st.legacy_threshold_raw;
    s.uptime_ms = Hysteresis::elapsedMs(now_ms, st.boot_ms);
    return s;
}

const char* modeName(ControllerMode mode) {
    return (mode == ControllerMode::AUTO) ? "auto" : "manual";
}

const char* decisionName(PumpDecision decision) {
    switch (decision) {
        case PumpDecision::NONE:             return "none";
        case PumpDecision::TURN_ON:          return "dry";
        case PumpDecision::TURN_OFF_WET:     return "wet";
        case PumpDecision::TURN_OFF_LOCKOUT: return "tank_empty";
        case PumpDecision::MANUAL_ON:        return "manual_on";
        case PumpDecision::MANUAL_OFF:       return "manual_off";
    }
    return "unknown";
}
