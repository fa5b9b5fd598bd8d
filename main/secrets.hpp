#ifndef SECRETS_HPP
#define SECRETS_HPP

// Replace with site values before flashing; do not commit real credentials.
namespace Secrets {
    static constexpr const char* WIFI_SSID = "YOUR_WIFI_SSID";
    static constexpr const char* WIFI_PASSWORD = "YOUR_WIFI_PASSWORD";
    static constexpr const char* DEVICE_ID = "irrigation-node-01";
    static constexpr const char* MQTT_HOST = "192.168.1.10";
    static constexpr int MQTT_PORT = 1883;
}

#endif // SECRETS_HPP
