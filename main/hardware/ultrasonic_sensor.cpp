#include <main/hardware/ultrasonic_sensor.hpp>
#include <main/control/tank_monitor.hpp>
#include <esp_timer.h>
#include <esp_rom_sys.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static constexpr uint8_t kMaxPulses = 16;
    static constexpr uint32_t kTriggerPulseUs = 10;
}

UltrasonicSensor::UltrasonicSensor(const Config& cfg_in)
    : cfg(cfg_in), initialized(false) {}

bool UltrasonicSensor::init() {
    gpio_config_t trig_conf = {};
    trig_conf.intr_type = GPIO_INTR_DISABLE;
    trig_conf.mode = GPIO_MODE_OUTPUT;
    trig_conf.pin_bit_mask = (1ULL << cfg.trig);
    trig_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    trig_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    if (gpio_config(&trig_conf) != ESP_OK) {
        return false;
    }

    gpio_config_t echo_conf = {};
    echo_conf.intr_type = GPIO_INTR_DISABLE;
    echo_conf.mode = GPIO_MODE_INPUT;
    echo_conf.pin_bit_mask = (1ULL << cfg.echo);
    // Idle low when the sensor is unplugged so a missing sensor reads as timeout
    echo_conf.pull_down_en = GPIO_PULLDOWN_ENABLE;
    echo_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    if (gpio_config(&echo_conf) != ESP_OK) {
        return false;
    }

    gpio_set_level(cfg.trig, 0);
    if (cfg.pulse_count == 0) cfg.pulse_count = 1;
    if (cfg.pulse_count > kMaxPulses) cfg.pulse_count = kMaxPulses;
    initialized = true;
    return true;
}

bool UltrasonicSensor::waitForLevel(int level, int64_t deadline_us) const {
    while (gpio_get_level(cfg.echo) != level) {
        if (esp_timer_get_time() > deadline_us) {
            return false;
        }
    }
    return true;
}

bool UltrasonicSensor::ping(uint32_t& echo_us) {
    gpio_set_level(cfg.trig, 0);
    esp_rom_delay_us(2);
    gpio_set_level(cfg.trig, 1);
    esp_rom_delay_us(kTriggerPulseUs);
    gpio_set_level(cfg.trig, 0);

    // Both the wait for the echo to start and its width share one window
    const int64_t deadline = esp_timer_get_time() + static_cast<int64_t>(cfg.echo_timeout_us);
    if (!waitForLevel(1, deadline)) {
        return false;
    }
    const int64_t rise = esp_timer_get_time();
    if (!waitForLevel(0, deadline)) {
        return false;
    }
    echo_us = static_cast<uint32_t>(esp_timer_get_time() - rise);
    return true;
}

void UltrasonicSensor::read(uint32_t now_ms, TankReading& out) {
    TankMonitor::EchoSample samples[kMaxPulses] = {};
    if (initialized) {
        for (uint8_t i = 0; i < cfg.pulse_count; ++i) {
            uint32_t echo_us = 0;
            samples[i].valid = ping(echo_us);
            samples[i].distance_cm = samples[i].valid ? TankMonitor::echoToDistanceCm(echo_us) : 0.0f;
            if (i + 1 < cfg.pulse_count) {
                vTaskDelay(pdMS_TO_TICKS(cfg.pulse_gap_ms));
            }
        }
    }
    out = TankMonitor::aggregate(samples, initialized ? cfg.pulse_count : 0,
                                 cfg.empty_distance_cm, now_ms);
}
