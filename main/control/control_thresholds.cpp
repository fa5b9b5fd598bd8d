#include <main/control/control_thresholds.hpp>
#include <main/config/control_config.hpp>

namespace ThresholdConfig {
    ControlThresholds fromBuildConfig() {
        using namespace Config::Control;
        ControlThresholds t{};
        t.on_percent = on_percent;
        t.off_percent = off_percent;
        t.min_on_ms = min_on_ms;
        t.min_off_ms = min_off_ms;
        t.dry_hold_ms = dry_hold_ms;
        t.ema_alpha = ema_alpha;
        t.raw_dry = Config::Calibration::raw_dry;
        t.raw_wet = Config::Calibration::raw_wet;
        t.tank_protection_enabled = tank_protection_enabled;
        t.tank_empty_distance_cm = tank_empty_distance_cm;
        t.sensor_loss_policy = hold_lockout_on_sensor_loss ? SensorLossPolicy::HOLD_LOCKOUT
                                                           : SensorLossPolicy::CLEAR_LOCKOUT;
        t.tank_height_cm = Config::TankGeometry::height_cm;
        t.tank_radius_cm = Config::TankGeometry::radius_cm;
        return t;
    }

    ConfigError validate(const ControlThresholds& t) {
        if (t.raw_dry > Config::Calibration::adc_max || t.raw_wet > Config::Calibration::adc_max) {
            return ConfigError::CALIBRATION_OUT_OF_RANGE;
        }
        if (t.raw_dry == t.raw_wet) {
            return ConfigError::CALIBRATION_EQUAL;
        }
        if (t.on_percent > 100 || t.off_percent > 100) {
            return ConfigError::PERCENT_OUT_OF_RANGE;
        }
        if (t.on_percent >= t.off_percent) {
            return ConfigError::HYSTERESIS_INVERTED;
        }
        // Negated form also rejects NaN
        if (!(t.ema_alpha > 0.0f && t.ema_alpha <= 1.0f)) {
            return ConfigError::EMA_ALPHA_OUT_OF_RANGE;
        }
        if (t.tank_protection_enabled && !(t.tank_empty_distance_cm > 0.0f)) {
            return ConfigError::TANK_THRESHOLD_INVALID;
        }
        if (!(t.tank_height_cm > 0.0f) || !(t.tank_radius_cm > 0.0f)) {
            return ConfigError::TANK_GEOMETRY_INVALID;
        }
        return ConfigError::NONE;
    }

    const char* describe(ConfigError err) {
        switch (err) {
            case ConfigError::NONE:                     return "ok";
            case ConfigError::CALIBRATION_EQUAL:        return "dry and wet calibration are equal";
            case ConfigError::CALIBRATION_OUT_OF_RANGE: return "calibration raw value above ADC range";
            case ConfigError::PERCENT_OUT_OF_RANGE:     return "hysteresis percent above 100";
            case ConfigError::HYSTERESIS_INVERTED:      return "on_percent must be below off_percent";
            case ConfigError::EMA_ALPHA_OUT_OF_RANGE:   return "ema_alpha must be in (0, 1]";
            case ConfigError::TANK_THRESHOLD_INVALID:   return "tank empty distance must be positive";
            case ConfigError::TANK_GEOMETRY_INVALID:    return "tank height and radius must be positive";
        }
        return "unknown";
    }
}
