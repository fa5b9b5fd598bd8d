#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>
#include <main/config/control_config.hpp>
#include <driver/gpio.h>
#include <hal/adc_types.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Hardware {
namespace Pins {
    // Relay/MOSFET gate driving the pump
    static constexpr gpio_num_t pump_gpio = GPIO_NUM_26;
    static constexpr bool pump_active_high = true;
    // HC-SR04 class ultrasonic sensor (echo through a 5V->3V3 divider)
    static constexpr gpio_num_t ultrasonic_trig_gpio = GPIO_NUM_18;
    static constexpr gpio_num_t ultrasonic_echo_gpio = GPIO_NUM_19;
} // namespace Pins

namespace Moisture {
    static constexpr adc_unit_t unit = ADC_UNIT_1;
    static constexpr adc_channel_t channel = ADC_CHANNEL_6;   // GPIO34
    static constexpr adc_atten_t attenuation = ADC_ATTEN_DB_12;
    static constexpr uint8_t sample_count = 10;
    static constexpr uint32_t sample_delay_ms = 5;
}

namespace Tank {
    static constexpr uint8_t  pulse_count = 5;
    static constexpr uint32_t echo_timeout_us = 30000;
    // HC-SR04 needs ~60 ms between pings to let ringing die out
    static constexpr uint32_t pulse_gap_ms = 60;
}
}

namespace Tasks {
namespace Control {
    static constexpr uint32_t period_ms = 1000;

    // Worst case blocking time of one sensor pass
    static constexpr uint32_t sensor_pass_ms =
        Hardware::Moisture::sample_count * Hardware::Moisture::sample_delay_ms +
        Hardware::Tank::pulse_count * (Hardware::Tank::echo_timeout_us / 1000 + Hardware::Tank::pulse_gap_ms);
    static_assert(sensor_pass_ms < period_ms, "control period must exceed one full sensor pass");
}
namespace Cloud {
    static constexpr uint32_t status_period_ms = 10000;
    static constexpr uint32_t reconnect_interval_ms = 30000;
    static constexpr uint32_t telemetry_period_ms = 1000;
}
}

namespace Watchdog {
    static constexpr uint32_t timeout_ms = 8000;
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_cloud_comm = true;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Control loop owns the pump and must keep its period
    static constexpr UBaseType_t HIGH   = tskIDLE_PRIORITY + 2;
    // Network I/O can tolerate latency
    static constexpr UBaseType_t NORMAL = tskIDLE_PRIORITY + 1;
}

namespace Mqtt {
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;

    static constexpr bool clean_session = true;
    static constexpr uint16_t keepalive_seconds = 60;
    static constexpr int default_qos = 1;
    static constexpr bool telemetry_retain = true;
    static constexpr bool lwt_enable = true;

    // MQTT Topic Templates (use with device ID via snprintf)
    namespace Topics {
        static constexpr const char* TELEMETRY = "irrigation/%s/telemetry";
        static constexpr const char* STATUS = "irrigation/%s/status";
        static constexpr const char* CMD = "irrigation/%s/cmd";
        static constexpr const char* CMD_ACK = "irrigation/%s/cmd-ack";
    }
}
}

#endif // CONFIG_HPP
