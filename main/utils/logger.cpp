#include <main/utils/logger.hpp>
#include <cstdio>
#include <cstring>

LogLevel Logger::s_level = LogLevel::INFO;

namespace {
    static esp_log_level_t toEspLevel(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return ESP_LOG_ERROR;
            case LogLevel::WARN:  return ESP_LOG_WARN;
            case LogLevel::INFO:  return ESP_LOG_INFO;
            case LogLevel::DEBUG: return ESP_LOG_DEBUG;
        }
        return ESP_LOG_INFO;
    }
}

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

void Logger::setEspLogLevel(const char* tag, esp_log_level_t level) {
    esp_log_level_set(tag, level);
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }
    const esp_log_level_t esp_level = toEspLevel(level);
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        ESP_LOG_LEVEL(esp_level, tag, "%s", "formatting error");
        return;
    }
    if (static_cast<size_t>(n) >= sizeof(buffer)) {
        // Mark truncated lines
        std::memcpy(buffer + sizeof(buffer) - 4, "...", 4);
    }
    ESP_LOG_LEVEL(esp_level, tag, "%s", buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
