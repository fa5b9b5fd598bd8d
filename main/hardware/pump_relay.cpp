#include <main/hardware/pump_relay.hpp>
#include <driver/gpio.h>

PumpRelay::PumpRelay(gpio_num_t relay_pin, bool active_high_level)
    : pin(relay_pin), active_high(active_high_level) {}

bool PumpRelay::init() {
    // Latch the OFF level before switching the pin to output
    gpio_set_level(pin, active_high ? 0 : 1);

    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_down_en = active_high ? GPIO_PULLDOWN_ENABLE : GPIO_PULLDOWN_DISABLE;
    io_conf.pull_up_en = active_high ? GPIO_PULLUP_DISABLE : GPIO_PULLUP_ENABLE;
    if (gpio_config(&io_conf) != ESP_OK) {
        return false;
    }
    drive(false);
    return true;
}

void PumpRelay::drive(bool on) {
    const int level = (on == active_high) ? 1 : 0;
    gpio_set_level(pin, level);
}
