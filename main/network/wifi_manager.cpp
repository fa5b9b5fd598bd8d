#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>
#include <cstring>

static const char* TAG = "WIFI";

WiFiManager::WiFiManager()
    : initialized(false),
      got_ip(false),
      retry_count(0),
      ip_str{},
      wifi_handler(nullptr),
      ip_handler(nullptr) {}

const char* WiFiManager::ssid() const {
    return Config::Wifi::ssid;
}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    // NVS is brought up by app_main before any task starts
    esp_err_t err = esp_netif_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_netif_init failed: %d", static_cast<int>(err));
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %d", static_cast<int>(err));
        return false;
    }
    if (esp_netif_create_default_wifi_sta() == nullptr) {
        LOG_ERROR(TAG, "%s", "Default STA netif create failed");
        return false;
    }

    wifi_init_config_t init_cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&init_cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_init failed: %d", static_cast<int>(err));
        return false;
    }

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT, ESP_EVENT_ANY_ID, &WiFiManager::onWifiEvent, this, &wifi_handler));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT, IP_EVENT_STA_GOT_IP, &WiFiManager::onIpEvent, this, &ip_handler));

    wifi_config_t sta_cfg = {};
    std::snprintf(reinterpret_cast<char*>(sta_cfg.sta.ssid),
                  sizeof(sta_cfg.sta.ssid), "%s", Config::Wifi::ssid);
    std::snprintf(reinterpret_cast<char*>(sta_cfg.sta.password),
                  sizeof(sta_cfg.sta.password), "%s", Config::Wifi::password);
    sta_cfg.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    sta_cfg.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    sta_cfg.sta.pmf_cfg.capable = true;
    sta_cfg.sta.pmf_cfg.required = false;

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));
    ESP_ERROR_CHECK(esp_wifi_set_config(WIFI_IF_STA, &sta_cfg));
    ESP_ERROR_CHECK(esp_wifi_start());
    initialized = true;

    // WIFI_EVENT_STA_START triggers the first connect when auto-connect is on
    return true;
}

bool WiFiManager::connect() {
    if (!initialized && !init()) {
        return false;
    }
    retry_count = 0;
    got_ip = false;
    ip_str[0] = '\0';
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %d", static_cast<int>(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

void WiFiManager::disconnect() {
    (void)esp_wifi_disconnect();
    got_ip = false;
    ip_str[0] = '\0';
}

bool WiFiManager::reconnect() {
    disconnect();
    return connect();
}

void WiFiManager::onWifiEvent(void* arg, esp_event_base_t, int32_t event_id, void*) {
    auto* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            if (Config::Wifi::auto_connect_on_start) {
                (void)esp_wifi_connect();
            }
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "Associated with AP");
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            self->got_ip = false;
            self->ip_str[0] = '\0';
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count++;
                LOG_WARN(TAG, "Disconnected, retry %d/%d", self->retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                LOG_ERROR(TAG, "Giving up after %d retries; cloud task will retry later",
                          Config::Wifi::max_retry_count);
            }
            break;
        default:
            break;
    }
}

void WiFiManager::onIpEvent(void* arg, esp_event_base_t, int32_t event_id, void* event_data) {
    auto* self = static_cast<WiFiManager*>(arg);
    if (event_id != IP_EVENT_STA_GOT_IP || event_data == nullptr) {
        return;
    }
    const auto* got = static_cast<const ip_event_got_ip_t*>(event_data);
    std::snprintf(self->ip_str, sizeof(self->ip_str), IPSTR, IP2STR(&got->ip_info.ip));
    self->got_ip = true;
    self->retry_count = 0;
    LOG_INFO(TAG, "Got IP %s", self->ip_str);
}
