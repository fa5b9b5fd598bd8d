#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>

// Station-mode WiFi link using Config::Wifi credentials
class WiFiManager {
public:
    WiFiManager();

    bool init();
    bool connect();
    void disconnect();
    bool reconnect();

    bool hasIp() const { return got_ip; }

    // Dotted quad of the current lease, empty string without one
    const char* ipAddress() const { return ip_str; }
    const char* ssid() const;

private:
    static void onWifiEvent(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void onIpEvent(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    volatile bool got_ip;
    int retry_count;
    char ip_str[16];

    esp_event_handler_instance_t wifi_handler;
    esp_event_handler_instance_t ip_handler;
};

#endif // WIFI_MANAGER_HPP
