#ifndef SOIL_SAMPLE_HPP
#define SOIL_SAMPLE_HPP

#include <cstdint>

// One soil moisture reading produced per control tick
struct SoilSample {
    uint16_t raw;      // averaged ADC count, 0..4095
    float    smoothed; // EMA of raw
    uint8_t  percent;  // 0..100 after calibration
    uint32_t ts_ms;    // sample timestamp in milliseconds
};

#endif // SOIL_SAMPLE_HPP
