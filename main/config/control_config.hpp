#ifndef CONTROL_CONFIG_HPP
#define CONTROL_CONFIG_HPP

#include <cstdint>

// Hardware-independent control constants. Kept apart from config.hpp so the
// control core can be built and tested without ESP-IDF headers.
namespace Config {
namespace Calibration {
    // Capacitive probe: higher raw = drier (adjust in field)
    static constexpr uint16_t raw_dry = 3200;
    static constexpr uint16_t raw_wet = 1300;
    static constexpr uint16_t adc_max = 4095;
}

namespace Control {
    // Hysteresis band (percent, both inclusive)
    static constexpr uint8_t  on_percent  = 30;
    static constexpr uint8_t  off_percent = 45;

    // Time windows
    static constexpr uint32_t min_on_ms   = 15000;
    static constexpr uint32_t min_off_ms  = 30000;
    static constexpr uint32_t dry_hold_ms = 5000;

    // EMA smoothing factor for the averaged soil raw value, (0, 1]
    static constexpr float ema_alpha = 0.2f;

    // Tank protection
    static constexpr bool  tank_protection_enabled = true;
    static constexpr float tank_empty_distance_cm  = 8.5f;
    // false: clear lockout when the ultrasonic sensor gives no reading
    // true:  keep the previous lockout state until a valid reading arrives
    static constexpr bool  hold_lockout_on_sensor_loss = true;

    // Display-only raw threshold reported for older dashboards
    static constexpr uint16_t legacy_threshold_raw = 2000;
}

namespace TankGeometry {
    // Cylinder measured from the sensor face down to the tank floor
    static constexpr float height_cm = 9.5f;
    static constexpr float radius_cm = 4.85f;
}
}

#endif // CONTROL_CONFIG_HPP
