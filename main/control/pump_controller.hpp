#ifndef PUMP_CONTROLLER_HPP
#define PUMP_CONTROLLER_HPP

#include <cstdint>
#include <main/models/pump_state.hpp>
#include <main/models/soil_sample.hpp>
#include <main/models/tank_reading.hpp>
#include <main/models/telemetry_snapshot.hpp>
#include <main/control/control_thresholds.hpp>
#include <main/control/pump_output.hpp>

// Everything the controller mutates. Owned by one PumpController; callers
// only get a const view.
struct ControllerState {
    ControllerMode mode;
    PumpActuator   pump;
    DebounceState  debounce;
    bool           lockout;

    bool        has_soil;
    SoilSample  soil;
    bool        has_tank;
    TankReading tank;

    uint16_t     legacy_threshold_raw;
    PumpDecision last_decision;
    uint32_t     transitions;
    uint32_t     boot_ms;
};

// Sensor results for one tick. has_soil is false when the ADC read failed.
struct TickInputs {
    bool        has_soil;
    SoilSample  soil;
    TankReading tank;
};

struct TickResult {
    PumpDecision decision;
    bool         lockout_changed;
    bool         evaluated; // false in MANUAL mode
};

// Mode and actuation arbiter: the only writer of the pump output, the mode
// and the debounce window. Not thread-safe; the control task serialises
// ticks and commands.
class PumpController {
public:
    // output may be null (no physical drive)
    PumpController(const ControlThresholds& thresholds, PumpOutput* output);

    // Drives the pump OFF and resets to AUTO. A fresh boot counts as having
    // rested for min_off_ms already.
    void begin(uint32_t now_ms, uint16_t legacy_threshold_raw);

    // Record readings, update lockout and, in AUTO, apply the hysteresis
    // decision. MANUAL leaves the pump exactly as last commanded.
    TickResult tick(uint32_t now_ms, const TickInputs& inputs);

    // Forces MANUAL and applies the state without debounce or lockout checks.
    // Returns MANUAL_ON/MANUAL_OFF, or NONE when the pump was already there
    // (timers are not re-stamped in that case).
    PumpDecision setManual(bool on, uint32_t now_ms);

    // Switches mode without touching the pump; returns false if unchanged.
    // A change drops any running dry window so AUTO starts a fresh one.
    bool setMode(ControllerMode mode);

    // Display-only value; never read by AUTO logic
    void setLegacyThreshold(uint16_t raw);

    TelemetrySnapshot snapshot(uint32_t now_ms) const;

    const ControllerState& state() const { return st; }
    const ControlThresholds& thresholds() const { return cfg; }
    bool pumpOn() const { return st.pump.is_on; }
    ControllerMode mode() const { return st.mode; }

private:
    void apply(PumpDecision decision, uint32_t now_ms);

    ControlThresholds cfg;
    PumpOutput* output;
    ControllerState st;
};

const char* modeName(ControllerMode mode);
const char* decisionName(PumpDecision decision);

#endif // PUMP_CONTROLLER_HPP
