#ifndef PUMP_RELAY_HPP
#define PUMP_RELAY_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <main/control/pump_output.hpp>

// GPIO driven relay/MOSFET for the water pump
class PumpRelay : public PumpOutput {
public:
    // active_high: true if driving the GPIO high energises the pump
    explicit PumpRelay(gpio_num_t relay_pin, bool active_high = true);

    // Configure the GPIO and force the pump OFF
    bool init();

    void drive(bool on) override;

private:
    gpio_num_t pin;
    bool active_high;
};

#endif // PUMP_RELAY_HPP
