#include <main/hardware/soil_moisture_sensor.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

SoilMoistureSensor::SoilMoistureSensor(const Config& cfg_in)
    : cfg(cfg_in),
      adc_handle(nullptr),
      filter(cfg_in.ema_alpha, cfg_in.raw_dry, cfg_in.raw_wet) {}

bool SoilMoistureSensor::init() {
    if (cfg.sample_count == 0) {
        cfg.sample_count = 1;
    }
    if (cfg.sample_count > max_samples) {
        cfg.sample_count = max_samples;
    }
    if (adc_handle == nullptr) {
        adc_oneshot_unit_init_cfg_t unit_cfg = {};
        unit_cfg.unit_id = cfg.unit;
        unit_cfg.ulp_mode = ADC_ULP_MODE_DISABLE;
        if (adc_oneshot_new_unit(&unit_cfg, &adc_handle) != ESP_OK) {
            adc_handle = nullptr;
            return false;
        }
    }
    adc_oneshot_chan_cfg_t chan_cfg = {};
    chan_cfg.bitwidth = ADC_BITWIDTH_12;
    chan_cfg.atten = cfg.attenuation;
    return adc_oneshot_config_channel(adc_handle, cfg.channel, &chan_cfg) == ESP_OK;
}

bool SoilMoistureSensor::read(uint32_t now_ms, SoilSample& out_sample) {
    if (!adc_handle) {
        return false;
    }
    uint16_t samples[max_samples];
    for (uint8_t i = 0; i < cfg.sample_count; ++i) {
        int raw = 0;
        if (adc_oneshot_read(adc_handle, cfg.channel, &raw) != ESP_OK) {
            return false;
        }
        if (raw < 0) raw = 0;
        if (raw > 4095) raw = 4095;
        samples[i] = static_cast<uint16_t>(raw);
        if (i + 1 < cfg.sample_count && cfg.sample_delay_ms > 0) {
            vTaskDelay(pdMS_TO_TICKS(cfg.sample_delay_ms));
        }
    }
    const uint16_t avg = MoistureFilter::average(samples, cfg.sample_count);
    out_sample = filter.update(avg, now_ms);
    return true;
}
