#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <cstdint>
#include <mqtt_client.h>

// esp-mqtt wrapper. Remembers one command subscription and restores it on
// every (re)connect; publishes a retained "offline" LWT on the status topic.
class MqttClient {
public:
    using MessageHandler = void (*)(const char* topic, int topic_len, const char* payload, int length);

    MqttClient(const char* host, int port, const char* client_id);

    bool start();
    void stop();
    bool isConnected() const { return connected; }

    // Returns message id, or -1 when not connected / rejected
    int publish(const char* topic, const char* payload, int qos, bool retain);

    // Subscribed now if connected, and again after each reconnect
    void setCommandTopic(const char* topic, int qos);
    void setMessageHandler(MessageHandler handler);

private:
    static void onEvent(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    volatile bool connected;
    MessageHandler on_message;
    char uri[128];
    char status_topic[96];
    char command_topic[96];
    int command_qos;
};

#endif // MQTT_CLIENT_HPP
