#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <esp_timer.h>
#include <main/tasks/cloud_communication_task.hpp>
#include <main/utils/logger.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/config/config.hpp>
#include <main/models/command.hpp>
#include <main/models/telemetry_snapshot.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/protocol/command_parser.hpp>
#include <main/protocol/telemetry_codec.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "CLOUD_TASK";

namespace {
    static WiFiManager s_wifi_manager;
    static MqttClient s_mqtt_client(Config::Mqtt::host, Config::Mqtt::port, Config::Device::id);

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];

    static QueueHandle_t s_command_queue = nullptr;
    static QueueHandle_t s_telemetry_queue = nullptr;
    static QueueHandle_t s_ack_queue = nullptr;
    static const char* s_config_error = nullptr;

    static TelemetrySnapshot s_last_snapshot{};
    static bool s_have_snapshot = false;

    static uint32_t nowMs() {
        return static_cast<uint32_t>(esp_timer_get_time() / 1000ULL);
    }

    static void reject(const char* command, const char* id, const char* error) {
        if (s_ack_queue == nullptr) {
            return;
        }
        CloudPublishRequest req{};
        std::snprintf(req.topic, sizeof(req.topic), Config::Mqtt::Topics::CMD_ACK, Config::Device::id);
        if (TelemetryCodec::formatReject(command, id, error, req.payload, sizeof(req.payload)) < 0) {
            return;
        }
        if (xQueueSend(s_ack_queue, &req, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "ack_queue full, dropped rejection");
        }
    }

    // Runs in the esp-mqtt task: parse only, never touch controller state
    static void onMqttMessage(const char* topic, int topic_len, const char* payload, int length) {
        ParsedCommand parsed = CommandParser::parse(payload, length, nowMs());
        const char* id = (parsed.command.request_id[0] != '\0') ? parsed.command.request_id : nullptr;

        if (parsed.error != CommandError::NONE) {
            LOG_WARN(TAG, "MQTT RX rejected on %.*s: %s", topic_len, topic,
                     CommandParser::describe(parsed.error));
            reject(parsed.name, id, CommandParser::describe(parsed.error));
            return;
        }
        if (s_command_queue == nullptr) {
            LOG_WARN(TAG, "MQTT RX %s ignored: controller not running", parsed.name);
            reject(parsed.name, id, "config_error");
            return;
        }
        if (xQueueSend(s_command_queue, &parsed.command, 0) != pdTRUE) {
            LOG_WARN(TAG, "MQTT RX queue full, dropped %s", parsed.name);
            reject(parsed.name, id, "busy");
            return;
        }
        LOG_INFO(TAG, "MQTT RX parsed: %s value=%ld", parsed.name, static_cast<long>(parsed.command.value));
    }

    static void publishTelemetry() {
        char topic[96];
        char payload[512];
        std::snprintf(topic, sizeof(topic), Config::Mqtt::Topics::TELEMETRY, Config::Device::id);
        TelemetryCodec::NetworkInfo net{};
        net.ip = s_wifi_manager.hasIp() ? s_wifi_manager.ipAddress() : nullptr;
        net.wifi_ssid = s_wifi_manager.ssid();
        if (TelemetryCodec::formatTelemetry(s_last_snapshot, &net, payload, sizeof(payload)) < 0) {
            LOG_WARN(TAG, "%s", "Telemetry payload did not fit");
            return;
        }
        (void)s_mqtt_client.publish(topic, payload, Config::Mqtt::default_qos, Config::Mqtt::telemetry_retain);
        LOG_DEBUG(TAG, "MQTT TX topic=%s payload=%s", topic, payload);
    }

    static void publishStatus() {
        char topic[96];
        char payload[192];
        std::snprintf(topic, sizeof(topic), Config::Mqtt::Topics::STATUS, Config::Device::id);
        if (TelemetryCodec::formatStatus(nowMs() / 1000U, s_config_error, payload, sizeof(payload)) < 0) {
            return;
        }
        (void)s_mqtt_client.publish(topic, payload, Config::Mqtt::default_qos, true);
        LOG_INFO(TAG, "MQTT TX topic=%s payload=%s", topic, payload);
    }

    static void taskFunction(void* parameters) {
        (void)parameters;
        LOG_INFO(TAG, "%s", "Cloud Communication Task started");

        if (!s_wifi_manager.init()) {
            LOG_ERROR(TAG, "%s", "WiFi init failed");
            vTaskDelete(nullptr);
            return;
        }

        char cmd_topic[96];
        std::snprintf(cmd_topic, sizeof(cmd_topic), Config::Mqtt::Topics::CMD, Config::Device::id);
        s_mqtt_client.setMessageHandler(&onMqttMessage);
        s_mqtt_client.setCommandTopic(cmd_topic, Config::Mqtt::default_qos);

        bool was_connected = false;
        TickType_t last_status_time = xTaskGetTickCount();
        TickType_t last_telemetry_time = 0;
        TickType_t last_reconnect_attempt = xTaskGetTickCount();
        const TickType_t status_period = pdMS_TO_TICKS(Config::Tasks::Cloud::status_period_ms);
        const TickType_t telemetry_period = pdMS_TO_TICKS(Config::Tasks::Cloud::telemetry_period_ms);
        const TickType_t reconnect_interval = pdMS_TO_TICKS(Config::Tasks::Cloud::reconnect_interval_ms);

        for (;;) {
            const TickType_t now = xTaskGetTickCount();
            const bool has_ip = s_wifi_manager.hasIp();

            if (!has_ip && (now - last_reconnect_attempt) > reconnect_interval) {
                (void)s_wifi_manager.reconnect();
                last_reconnect_attempt = now;
            }
            if (has_ip) {
                (void)s_mqtt_client.start();
            }

            // Latest snapshot only; older ones were overwritten
            if (s_telemetry_queue != nullptr) {
                TelemetrySnapshot snap;
                if (xQueueReceive(s_telemetry_queue, &snap, 0) == pdTRUE) {
                    s_last_snapshot = snap;
                    s_have_snapshot = true;
                }
            }

            const bool connected = s_mqtt_client.isConnected();
            if (connected && !was_connected) {
                // Replace the retained LWT "offline" right away
                publishStatus();
                last_status_time = now;
            }
            was_connected = connected;

            if (connected && s_have_snapshot && (now - last_telemetry_time) >= telemetry_period) {
                publishTelemetry();
                last_telemetry_time = now;
            }

            if (connected && (now - last_status_time) > status_period) {
                publishStatus();
                last_status_time = now;
            }

            // Acks are not queued for later delivery while offline
            if (s_ack_queue != nullptr) {
                CloudPublishRequest req;
                int drained = 0;
                const int max_drain = 8;
                while (drained < max_drain && xQueueReceive(s_ack_queue, &req, 0) == pdTRUE) {
                    if (connected) {
                        (void)s_mqtt_client.publish(req.topic, req.payload, Config::Mqtt::default_qos, false);
                        LOG_INFO(TAG, "MQTT TX topic=%s payload=%s", req.topic, req.payload);
                    }
                    drained++;
                }
            }

            vTaskDelay(pdMS_TO_TICKS(100));
        }
    }
} // namespace

namespace CloudCommunicationTask {
    void create(QueueHandle_t command_queue,
                QueueHandle_t telemetry_queue,
                QueueHandle_t ack_queue,
                const char* config_error) {
        s_command_queue = command_queue;
        s_telemetry_queue = telemetry_queue;
        s_ack_queue = ack_queue;
        s_config_error = config_error;
        xTaskCreateStatic(taskFunction,
                          "cloud_comm",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::NORMAL,
                          s_task_stack,
                          &s_task_tcb);
    }
}
