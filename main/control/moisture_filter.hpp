#ifndef MOISTURE_FILTER_HPP
#define MOISTURE_FILTER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/soil_sample.hpp>

// Exponential moving average over the averaged soil ADC value, followed by
// the dry/wet calibration map. The EMA seeds itself from the first value.
class MoistureFilter {
public:
    MoistureFilter(float alpha, uint16_t raw_dry, uint16_t raw_wet);

    // Fold one averaged raw value into the EMA and build the tick's sample
    SoilSample update(uint16_t raw, uint32_t now_ms);

    bool hasValue() const { return seeded; }
    float value() const { return ema; }
    void reset();

    // Map raw to 0..100 (dry -> 0, wet -> 100), rounded and clamped.
    // Works for either probe polarity; equal endpoints give 0.
    static uint8_t toPercent(float raw, uint16_t raw_dry, uint16_t raw_wet);

    // Integer mean of count ADC samples; 0 when count is 0
    static uint16_t average(const uint16_t* samples, std::size_t count);

private:
    float alpha;
    uint16_t raw_dry;
    uint16_t raw_wet;
    bool seeded;
    float ema;
};

#endif // MOISTURE_FILTER_HPP
