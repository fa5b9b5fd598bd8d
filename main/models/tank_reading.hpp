#ifndef TANK_READING_HPP
#define TANK_READING_HPP

#include <cstdint>

// Filtered ultrasonic distance for one tick.
// has_distance is false when every pulse timed out; distance_cm is then
// meaningless and must not be compared against anything.
struct TankReading {
    bool     has_distance;
    float    distance_cm;   // sensor face to water surface
    uint8_t  valid_samples; // echoes that came back within the timeout
    bool     empty;         // distance_cm >= empty threshold
    uint32_t ts_ms;
};

#endif // TANK_READING_HPP
