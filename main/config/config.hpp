#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_log.h>
#include <main/config/dht_timing.hpp>
#include <main/utils/logger.hpp>

namespace Config {
namespace Hardware {
namespace Pins {
    // DHT11 data line. Needs an external 4.7k-10k pull-up to 3V3;
    // the internal pull-up alone is too weak for long leads.
    static constexpr gpio_num_t dht_gpio = GPIO_NUM_4;
} // namespace Pins
}

namespace Tasks {
namespace Climate {
    // DHT11 must not be polled faster than once per second
    static constexpr uint32_t period_ms = 2000;
    static constexpr uint32_t init_retry_ms = 2000;
    static constexpr uint32_t stack_bytes = 3072;
}
}

namespace Logging {
    static constexpr LogLevel default_level = LogLevel::INFO;
    // gpio_config() prints the full pin setup at INFO on every call
    static constexpr const char* gpio_driver_tag = "gpio";
    static constexpr esp_log_level_t gpio_driver_level = ESP_LOG_WARN;
}

namespace Watchdog {
    // Must exceed the longest task period by a comfortable margin
    static constexpr uint32_t timeout_ms = 8000;
    static constexpr bool trigger_panic = true;
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_climate_task = true;
    // Dump the raw frame bytes on every successful read (DEBUG level)
    static constexpr bool log_raw_frames = false;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Real-time: sensor sampling requires deterministic timing
    static constexpr UBaseType_t HIGH     = tskIDLE_PRIORITY + 2;
}
}

#endif // CONFIG_HPP
