#include <main/tasks/climate_sensor_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_timer.h>
#include <main/utils/logger.hpp>
#include <main/hardware/esp32_pin_transport.hpp>
#include <main/hardware/dht11_sensor.hpp>
#include <main/protocol/reading_converter.hpp>
#include <main/models/climate_data.hpp>
#include <main/models/reading_result.hpp>
#include <main/config/config.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "CLIMATE_TASK";

    // Static task resources
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Climate::stack_bytes / sizeof(StackType_t)];

    static gpio_num_t s_sensor_pin = Config::Hardware::Pins::dht_gpio;

    static void logFailure(const ReadingResult& result) {
        switch (result.status) {
            case ReadStatus::NO_RESPONSE:
                LOG_WARN(TAG, "Read failed (%s): no sensor on GPIO %d (disconnected or still settling)",
                         toString(result.status), static_cast<int>(s_sensor_pin));
                break;
            case ReadStatus::TIMEOUT:
                LOG_WARN(TAG, "Read failed (%s) during %s after %u bits",
                         toString(result.status), toString(result.phase),
                         static_cast<unsigned>(result.bits_received));
                break;
            case ReadStatus::CHECKSUM_MISMATCH: {
                const SensorFrame& f = result.frame;
                LOG_WARN(TAG, "Read failed (%s): rh=%u.%02u t=%u.%02u received=0x%02x computed=0x%02x",
                         toString(result.status),
                         f.humidity_integer, f.humidity_fraction,
                         f.temperature_integer, f.temperature_fraction,
                         f.checksum, result.computed_checksum);
                break;
            }
            case ReadStatus::OK:
                break;
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Climate Sensor Task started");
        const bool watched = Watchdog::subscribe();

        Esp32PinTransport transport(s_sensor_pin);
        Dht11Sensor sensor(transport, static_cast<int>(s_sensor_pin));

        bool inited = transport.init();
        if (!inited) {
            LOG_WARN(TAG, "%s", "Line init failed; will retry periodically");
        }

        // Sensor needs ~1 s after power-up before it answers
        vTaskDelay(pdMS_TO_TICKS(Config::Tasks::Climate::period_ms));

        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Climate::period_ms);

        for (;;) {
            if (watched) {
                Watchdog::feed();
            }
            if (!inited) {
                inited = transport.init();
                if (!inited) {
                    LOG_WARN(TAG, "%s", "Line init retry failed");
                    vTaskDelay(pdMS_TO_TICKS(Config::Tasks::Climate::init_retry_ms));
                    continue;
                }
                LOG_INFO(TAG, "%s", "Line init successful");
                last_wake = xTaskGetTickCount();
            }

            ReadingResult result = sensor.readFrame();

            esp_err_t driver_err = transport.takeError();
            if (driver_err != ESP_OK) {
                LOG_ERROR(TAG, "GPIO driver error during read: %s", esp_err_to_name(driver_err));
            }

            if (result.ok()) {
                ClimateData sample;
                sample.temp_c = ReadingConverter::toCelsius(result.frame);
                sample.humidity_pct = ReadingConverter::toHumidity(result.frame);
                sample.ts_ms = static_cast<uint32_t>(esp_timer_get_time() / 1000ULL);
                LOG_INFO(TAG, "T=%.2f C (%.2f F)  RH=%.2f %%  @%lu ms",
                         sample.temp_c,
                         ReadingConverter::fromCelsius(sample.temp_c, TemperatureScale::FAHRENHEIT),
                         sample.humidity_pct,
                         static_cast<unsigned long>(sample.ts_ms));
                if (Config::Features::log_raw_frames) {
                    const uint8_t raw[Config::Dht::frame_bytes] = {
                        result.frame.humidity_integer, result.frame.humidity_fraction,
                        result.frame.temperature_integer, result.frame.temperature_fraction,
                        result.frame.checksum
                    };
                    Logger::bytes(LogLevel::DEBUG, TAG, "frame", raw, sizeof(raw));
                }
            } else {
                logFailure(result);
            }

            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace ClimateSensorTask {
    void create(gpio_num_t sensor_pin) {
        s_sensor_pin = sensor_pin;
        TaskHandle_t handle = xTaskCreateStatic(taskFunction, "climate_sensor",
                                                sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                                                Config::TaskPriorities::HIGH, s_task_stack, &s_task_tcb);
        if (handle == nullptr) {
            LOG_ERROR(TAG, "%s", "Failed to create climate sensor task");
        }
    }
}
