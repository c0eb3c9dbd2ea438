#include <main/hardware/esp32_pin_transport.hpp>
#include <main/utils/logger.hpp>
#include <driver/gpio.h>
#include <esp_rom_sys.h>
#include <esp_timer.h>
#include <freertos/task.h>

static const char* TAG_TRANSPORT = "PinTransport";

Esp32PinTransport::Esp32PinTransport(gpio_num_t pin_in)
    : pin(pin_in), pending_error(ESP_OK) {}

bool Esp32PinTransport::init() {
    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.pull_up_en = GPIO_PULLUP_ENABLE;
    esp_err_t ret = gpio_config(&io_conf);
    if (ret != ESP_OK) {
        LOG_ERROR(TAG_TRANSPORT, "gpio_config failed on GPIO %d: %s", pin, esp_err_to_name(ret));
        return false;
    }
    pending_error = ESP_OK;
    LOG_INFO(TAG_TRANSPORT, "Single-wire line ready on GPIO %d", pin);
    return true;
}

void Esp32PinTransport::latch(esp_err_t err) {
    if (err != ESP_OK && pending_error == ESP_OK) {
        pending_error = err;
    }
}

esp_err_t Esp32PinTransport::takeError() {
    esp_err_t err = pending_error;
    pending_error = ESP_OK;
    return err;
}

void Esp32PinTransport::digitalWrite(int pin_num, int level) {
    gpio_num_t gpio = static_cast<gpio_num_t>(pin_num);
    latch(gpio_set_direction(gpio, GPIO_MODE_OUTPUT));
    latch(gpio_set_level(gpio, level ? 1 : 0));
}

int Esp32PinTransport::digitalRead(int pin_num) {
    return gpio_get_level(static_cast<gpio_num_t>(pin_num));
}

void Esp32PinTransport::setPullMode(int pin_num, PullMode mode) {
    gpio_num_t gpio = static_cast<gpio_num_t>(pin_num);
    latch(gpio_set_direction(gpio, GPIO_MODE_INPUT));
    switch (mode) {
        case PullMode::PULL_UP:   latch(gpio_set_pull_mode(gpio, GPIO_PULLUP_ONLY)); break;
        case PullMode::PULL_DOWN: latch(gpio_set_pull_mode(gpio, GPIO_PULLDOWN_ONLY)); break;
        case PullMode::FLOATING:  latch(gpio_set_pull_mode(gpio, GPIO_FLOATING)); break;
    }
}

void Esp32PinTransport::delayMicroseconds(uint32_t us) {
    esp_rom_delay_us(us);
}

void Esp32PinTransport::delayMilliseconds(uint32_t ms) {
    // vTaskDelay may return up to one tick early; round up and add a tick
    // so the wait is never shorter than requested.
    TickType_t ticks = static_cast<TickType_t>((ms + portTICK_PERIOD_MS - 1) / portTICK_PERIOD_MS) + 1;
    vTaskDelay(ticks);
}

uint64_t Esp32PinTransport::micros() {
    return static_cast<uint64_t>(esp_timer_get_time());
}

void Esp32PinTransport::enterTimingCritical() {
    taskENTER_CRITICAL(&mux);
}

void Esp32PinTransport::exitTimingCritical() {
    taskEXIT_CRITICAL(&mux);
}
