#ifndef TANK_MONITOR_HPP
#define TANK_MONITOR_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/tank_reading.hpp>
#include <main/control/control_thresholds.hpp>

namespace TankMonitor {
    // One trigger/echo attempt
    struct EchoSample {
        bool  valid;       // false when no echo arrived within the timeout
        float distance_cm;
    };

    struct TankLevel {
        bool     valid;
        float    water_height_cm;
        uint8_t  percent;
        uint32_t volume_cm3;
        uint32_t capacity_cm3;
    };

    // Round-trip echo time to one-way distance (343 m/s at ~20 C)
    float echoToDistanceCm(uint32_t echo_us);

    // Mean of the valid samples; has_distance is false if none were valid
    TankReading aggregate(const EchoSample* samples, std::size_t count,
                          float empty_distance_cm, uint32_t now_ms);

    // Lockout for this tick. previous_lockout is only consulted when the
    // reading has no distance and the policy is HOLD_LOCKOUT.
    bool deriveLockout(const TankReading& reading, bool previous_lockout,
                       const ControlThresholds& t);

    // Water level of a vertical cylinder with the sensor at its rim
    TankLevel level(const TankReading& reading, float height_cm, float radius_cm);
}

#endif // TANK_MONITOR_HPP
