#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <esp_task_wdt.h>

namespace {
    static const char* TAG = "WATCHDOG";
    static bool s_feed_error_reported = false;
}

namespace Watchdog {
    void init() {
        esp_task_wdt_config_t config = {};
        config.timeout_ms = Config::Watchdog::timeout_ms;
        config.idle_core_mask = 0;  // idle tasks are not monitored
        config.trigger_panic = Config::Watchdog::trigger_panic;

        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            // TWDT not started by the bootloader config
            err = esp_task_wdt_init(&config);
        }
        if (err == ESP_OK) {
            LOG_INFO(TAG, "TWDT configured: %lu ms timeout",
                     static_cast<unsigned long>(Config::Watchdog::timeout_ms));
        } else {
            LOG_ERROR(TAG, "TWDT config failed: %s", esp_err_to_name(err));
        }
    }

    bool subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed: %s", esp_err_to_name(err));
            return false;
        }
        return true;
    }

    void feed() {
        esp_err_t err = esp_task_wdt_reset();
        if (err != ESP_OK && !s_feed_error_reported) {
            LOG_WARN(TAG, "TWDT feed failed: %s", esp_err_to_name(err));
            s_feed_error_reported = true;
        }
    }
}
