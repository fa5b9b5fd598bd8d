#ifndef CONTROL_THRESHOLDS_HPP
#define CONTROL_THRESHOLDS_HPP

#include <cstdint>

// What the tank monitor does with lockout when no echo came back
enum class SensorLossPolicy : uint8_t {
    CLEAR_LOCKOUT = 0, // fail-open
    HOLD_LOCKOUT = 1   // keep previous state
};

// Immutable control configuration, loaded once at boot
struct ControlThresholds {
    uint8_t  on_percent;  // dry at or below
    uint8_t  off_percent; // wet at or above
    uint32_t min_on_ms;
    uint32_t min_off_ms;
    uint32_t dry_hold_ms;

    float    ema_alpha;
    uint16_t raw_dry;
    uint16_t raw_wet;

    bool             tank_protection_enabled;
    float            tank_empty_distance_cm;
    SensorLossPolicy sensor_loss_policy;
    float            tank_height_cm;
    float            tank_radius_cm;
};

enum class ConfigError : uint8_t {
    NONE = 0,
    CALIBRATION_EQUAL,
    CALIBRATION_OUT_OF_RANGE,
    PERCENT_OUT_OF_RANGE,
    HYSTERESIS_INVERTED,
    EMA_ALPHA_OUT_OF_RANGE,
    TANK_THRESHOLD_INVALID,
    TANK_GEOMETRY_INVALID
};

namespace ThresholdConfig {
    // Thresholds built from Config::Control / Config::Calibration
    ControlThresholds fromBuildConfig();

    // First problem found, or ConfigError::NONE
    ConfigError validate(const ControlThresholds& t);

    const char* describe(ConfigError err);
}

#endif // CONTROL_THRESHOLDS_HPP
