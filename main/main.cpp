#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/tasks/climate_sensor_task.hpp>
#include <main/utils/watchdog.hpp>

extern "C" void app_main(void)
{
    Logger::setLevel(Config::Logging::default_level);
    Logger::setEspLogLevel(Config::Logging::gpio_driver_tag, Config::Logging::gpio_driver_level);
    LOG_INFO("MAIN", "%s", "---Climate probe started---");

    // Initialize Task Watchdog Timer before tasks subscribe to it
    Watchdog::init();

    if (Config::Features::enable_climate_task) {
        ClimateSensorTask::create(Config::Hardware::Pins::dht_gpio);
    } else {
        LOG_WARN("MAIN", "%s", "Climate task disabled by feature toggle");
    }

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
