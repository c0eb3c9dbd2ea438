#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

void Logger::setEspLogLevel(const char* tag, esp_log_level_t level) {
    esp_log_level_set(tag, level);
}

void Logger::emit(LogLevel level, const char* tag, const char* message) {
    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", message); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", message); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", message); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", message); break;
    }
}

void Logger::logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        emit(level, tag, "formatting error");
        return;
    }
    buffer[sizeof(buffer) - 1] = '\0';
    emit(level, tag, buffer);
}

void Logger::bytes(LogLevel level, const char* tag, const char* label, const uint8_t* data, size_t len) {
    if (!isEnabled(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int pos = snprintf(buffer, sizeof(buffer), "%s:", label);
    if (pos < 0) {
        emit(level, tag, "formatting error");
        return;
    }
    for (size_t i = 0; i < len; ++i) {
        // 3 chars per byte plus terminator
        if (static_cast<size_t>(pos) + 4 > sizeof(buffer)) {
            break;
        }
        pos += snprintf(buffer + pos, sizeof(buffer) - static_cast<size_t>(pos), " %02x", data[i]);
    }
    emit(level, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
