#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <esp_task_wdt.h>

namespace {
    static const char* TAG = "WATCHDOG";
}

namespace Watchdog {
    bool init() {
        esp_task_wdt_config_t config = {
            .timeout_ms = Config::Watchdog::timeout_ms,
            .idle_core_mask = 0,
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            // TWDT not started by sdkconfig; bring it up ourselves
            err = esp_task_wdt_init(&config);
        }
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "TWDT config failed: %d", static_cast<int>(err));
            return false;
        }
        LOG_INFO(TAG, "TWDT configured: %lu ms timeout",
                 static_cast<unsigned long>(Config::Watchdog::timeout_ms));
        return true;
    }

    bool subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed: %d", static_cast<int>(err));
            return false;
        }
        return true;
    }

    void feed() {
        (void)esp_task_wdt_reset();
    }
}
