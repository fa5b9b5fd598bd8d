#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <cstring>
#include <cstdio>

static const char* TAG = "MQTT";

MqttClient::MqttClient(const char* host_in, int port_in, const char* id)
    : client(nullptr),
      host(host_in),
      port(port_in),
      client_id(id),
      connected(false),
      on_message(nullptr),
      uri{},
      status_topic{},
      command_topic{},
      command_qos(Config::Mqtt::default_qos) {
    std::snprintf(status_topic, sizeof(status_topic), Config::Mqtt::Topics::STATUS, client_id);
}

bool MqttClient::start() {
    if (client != nullptr) {
        return true;
    }

    std::snprintf(uri, sizeof(uri), "mqtt://%s:%d", host, port);
    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = uri;
    cfg.credentials.client_id = client_id;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;
    if (Config::Mqtt::lwt_enable) {
        cfg.session.last_will.topic = status_topic;
        cfg.session.last_will.msg = "{\"status\":\"offline\"}";
        cfg.session.last_will.qos = Config::Mqtt::default_qos;
        cfg.session.last_will.retain = true;
    }

    client = esp_mqtt_client_init(&cfg);
    if (!client) {
        LOG_ERROR(TAG, "%s", "esp_mqtt_client_init failed");
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::onEvent, this);
    if (err == ESP_OK) {
        err = esp_mqtt_client_start(client);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "MQTT start failed: %d", static_cast<int>(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }
    LOG_INFO(TAG, "Connecting to %s as %s", uri, client_id);
    return true;
}

void MqttClient::stop() {
    if (client) {
        (void)esp_mqtt_client_stop(client);
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
    }
    connected = false;
}

int MqttClient::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (!client || !connected) {
        LOG_DEBUG(TAG, "Skip publish (offline) topic=%s", topic);
        return -1;
    }
    const int length = static_cast<int>(std::strlen(payload));
    const int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid < 0) {
        LOG_ERROR(TAG, "Publish failed topic=%s rc=%d", topic, mid);
    } else {
        LOG_DEBUG(TAG, "TX topic=%s len=%d mid=%d", topic, length, mid);
    }
    return mid;
}

void MqttClient::setCommandTopic(const char* topic, int qos) {
    std::snprintf(command_topic, sizeof(command_topic), "%s", topic);
    command_qos = qos;
    if (client && connected) {
        (void)esp_mqtt_client_subscribe(client, command_topic, command_qos);
    }
}

void MqttClient::setMessageHandler(MessageHandler handler) {
    on_message = handler;
}

void MqttClient::onEvent(void* handler_args, esp_event_base_t, int32_t, void* event_data) {
    auto* self = static_cast<MqttClient*>(handler_args);
    self->handleEvent(static_cast<esp_mqtt_event_handle_t>(event_data));
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            connected = true;
            LOG_INFO(TAG, "%s", "Connected");
            if (command_topic[0] != '\0') {
                int mid = esp_mqtt_client_subscribe(client, command_topic, command_qos);
                if (mid < 0) {
                    LOG_ERROR(TAG, "Subscribe failed topic=%s", command_topic);
                } else {
                    LOG_INFO(TAG, "Subscribed %s", command_topic);
                }
            }
            break;
        case MQTT_EVENT_DISCONNECTED:
            connected = false;
            LOG_WARN(TAG, "%s", "Disconnected");
            break;
        case MQTT_EVENT_DATA:
            // Multi-fragment messages are not expected for command payloads
            if (event->current_data_offset != 0 || event->data_len != event->total_data_len) {
                LOG_WARN(TAG, "Dropping fragmented message len=%d", event->total_data_len);
                break;
            }
            if (on_message) {
                on_message(event->topic, event->topic_len, event->data, event->data_len);
            }
            break;
        case MQTT_EVENT_ERROR:
            LOG_ERROR(TAG, "%s", "MQTT error event");
            break;
        default:
            break;
    }
}
