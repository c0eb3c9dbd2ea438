#ifndef CLIMATE_SENSOR_TASK_HPP
#define CLIMATE_SENSOR_TASK_HPP

#include <driver/gpio.h>

namespace ClimateSensorTask {
    // Creates a static FreeRTOS task that reads the DHT11 on sensor_pin once per
    // Config::Tasks::Climate::period_ms and logs the sample or the failure
    // diagnostics. Failed reads are not retried before the next period.
    void create(gpio_num_t sensor_pin);
}

#endif // CLIMATE_SENSOR_TASK_HPP
