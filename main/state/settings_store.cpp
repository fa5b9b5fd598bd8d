#include <main/state/settings_store.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>

static const char* TAG = "SETTINGS";
static const char* NVS_NAMESPACE = "irrigation";
static const char* KEY_LEGACY_THRESHOLD = "legacy_thr";

namespace SettingsStore {
    uint16_t loadLegacyThreshold(uint16_t fallback) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
        if (err == ESP_OK) {
            uint16_t value = 0;
            err = nvs_get_u16(handle, KEY_LEGACY_THRESHOLD, &value);
            nvs_close(handle);
            if (err == ESP_OK) {
                LOG_INFO(TAG, "Loaded legacy threshold %u from NVS", static_cast<unsigned>(value));
                return value;
            }
        }
        LOG_INFO(TAG, "No stored legacy threshold (%d); using %u",
                 static_cast<int>(err), static_cast<unsigned>(fallback));
        (void)saveLegacyThreshold(fallback);
        return fallback;
    }

    bool saveLegacyThreshold(uint16_t raw) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS open failed: %d", static_cast<int>(err));
            return false;
        }
        err = nvs_set_u16(handle, KEY_LEGACY_THRESHOLD, raw);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS set failed: %d", static_cast<int>(err));
            nvs_close(handle);
            return false;
        }
        err = nvs_commit(handle);
        nvs_close(handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS commit failed: %d", static_cast<int>(err));
            return false;
        }
        return true;
    }
}
