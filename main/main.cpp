#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <nvs_flash.h>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>
#include <main/config/config.hpp>
#include <main/control/control_thresholds.hpp>
#include <main/hardware/pump_relay.hpp>
#include <main/models/command.hpp>
#include <main/models/telemetry_snapshot.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/tasks/control_task.hpp>
#include <main/tasks/cloud_communication_task.hpp>

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::INFO);
    Logger::setEspLogLevel("wifi", ESP_LOG_WARN);
    LOG_INFO("MAIN", "---Irrigation controller %s started---", Config::Device::id);

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR("MAIN", "NVS init failed: %d", static_cast<int>(err));
    }

    if (!Watchdog::init()) {
        LOG_ERROR("MAIN", "%s", "Task watchdog init failed");
    }

    const ControlThresholds thresholds = ThresholdConfig::fromBuildConfig();
    const ConfigError config_error = ThresholdConfig::validate(thresholds);

    static uint8_t command_queue_storage[8 * sizeof(Command)];
    static StaticQueue_t command_queue_tcb;
    QueueHandle_t command_queue = xQueueCreateStatic(
        8, sizeof(Command), command_queue_storage, &command_queue_tcb);

    // Length 1, overwritten every control tick
    static uint8_t telemetry_queue_storage[1 * sizeof(TelemetrySnapshot)];
    static StaticQueue_t telemetry_queue_tcb;
    QueueHandle_t telemetry_queue = xQueueCreateStatic(
        1, sizeof(TelemetrySnapshot), telemetry_queue_storage, &telemetry_queue_tcb);

    static uint8_t ack_queue_storage[4 * sizeof(CloudPublishRequest)];
    static StaticQueue_t ack_queue_tcb;
    QueueHandle_t ack_queue = xQueueCreateStatic(
        4, sizeof(CloudPublishRequest), ack_queue_storage, &ack_queue_tcb);

    if (config_error == ConfigError::NONE) {
        ControlTask::create(command_queue, telemetry_queue, ack_queue, thresholds);
    } else {
        // Refuse to irrigate on a bad configuration; hold the pump OFF
        LOG_ERROR("MAIN", "Invalid control configuration: %s; control loop not started",
                  ThresholdConfig::describe(config_error));
        static PumpRelay safe_relay(Config::Hardware::Pins::pump_gpio, Config::Hardware::Pins::pump_active_high);
        if (!safe_relay.init()) {
            LOG_ERROR("MAIN", "%s", "Pump relay GPIO init failed");
        }
        command_queue = nullptr;
    }

    if (Config::Features::enable_cloud_comm) {
        CloudCommunicationTask::create(command_queue, telemetry_queue, ack_queue,
                                       config_error == ConfigError::NONE
                                           ? nullptr
                                           : ThresholdConfig::describe(config_error));
    }

    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
