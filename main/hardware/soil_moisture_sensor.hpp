#ifndef SOIL_MOISTURE_SENSOR_HPP
#define SOIL_MOISTURE_SENSOR_HPP

#include <cstdint>
#include <hal/adc_types.h>
#include <esp_adc/adc_oneshot.h>
#include <main/models/soil_sample.hpp>
#include <main/control/moisture_filter.hpp>

// Capacitive soil moisture probe on an ADC one-shot channel.
// Each read averages sample_count conversions spaced sample_delay_ms apart,
// then folds the mean into the EMA. The EMA survives across reads.
class SoilMoistureSensor {
public:
    static constexpr uint8_t max_samples = 32;

    struct Config {
        adc_unit_t    unit;
        adc_channel_t channel;
        adc_atten_t   attenuation;
        uint8_t       sample_count;    // 1..max_samples
        uint32_t      sample_delay_ms;
        uint16_t      raw_dry;
        uint16_t      raw_wet;
        float         ema_alpha;
    };

    explicit SoilMoistureSensor(const Config& cfg);

    // Create the ADC unit and configure the channel. Safe to call again
    // after a failure.
    bool init();

    // Blocking read. Returns false (EMA untouched) if any conversion fails.
    bool read(uint32_t now_ms, SoilSample& out_sample);

private:
    Config cfg;
    adc_oneshot_unit_handle_t adc_handle;
    MoistureFilter filter;
};

#endif // SOIL_MOISTURE_SENSOR_HPP
