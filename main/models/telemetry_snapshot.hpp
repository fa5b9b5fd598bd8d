#ifndef TELEMETRY_SNAPSHOT_HPP
#define TELEMETRY_SNAPSHOT_HPP

#include <cstdint>
#include <main/models/pump_state.hpp>

// Read-only view of the controller published to the dashboard
struct TelemetrySnapshot {
    bool     has_soil;
    uint16_t soil_raw;
    float    soil_smoothed;
    uint8_t  soil_percent;

    bool     has_tank_distance;
    float    tank_distance_cm;
    uint8_t  tank_valid_samples;
    uint8_t  tank_level_percent;
    uint32_t tank_volume_cm3;
    uint32_t tank_capacity_cm3;

    bool           lockout;
    bool           pump_on;
    ControllerMode mode;
    uint32_t       pump_state_ms; // time spent in the current pump state
    PumpDecision   last_decision;
    uint32_t       transitions;

    uint16_t legacy_threshold_raw;
    uint32_t uptime_ms;
};

#endif // TELEMETRY_SNAPSHOT_HPP
