#ifndef ULTRASONIC_SENSOR_HPP
#define ULTRASONIC_SENSOR_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <main/models/tank_reading.hpp>

// HC-SR04 class trigger/echo ranger mounted above the tank.
class UltrasonicSensor {
public:
    struct Config {
        gpio_num_t trig;
        gpio_num_t echo;
        uint8_t    pulse_count;     // pings per read
        uint32_t   echo_timeout_us; // no echo within this window = invalid ping
        uint32_t   pulse_gap_ms;
        float      empty_distance_cm;
    };

    explicit UltrasonicSensor(const Config& cfg);

    bool init();

    // Blocking: pulse_count pings, timed-out ones discarded, mean of the
    // rest. out.has_distance is false when every ping timed out.
    void read(uint32_t now_ms, TankReading& out);

private:
    // Round-trip echo time in microseconds; false on timeout
    bool ping(uint32_t& echo_us);
    bool waitForLevel(int level, int64_t deadline_us) const;

    Config cfg;
    bool initialized;
};

#endif // ULTRASONIC_SENSOR_HPP
