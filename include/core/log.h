#pragma once

#include <stdint.h>

enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace logging {

void set_level(LogLevel level);
LogLevel level();

// Reads MRLF_LOG_LEVEL (debug|info|warn|error); unset or unknown keeps the current level.
void configure_from_env();

// Prints "[tag] message" on stderr. Lines from concurrent tasks never interleave.
void logf(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

} // namespace logging

#define LOGD(tag, ...) ::logging::logf(LogLevel::DEBUG, tag, __VA_ARGS__)
#define LOGI(tag, ...) ::logging::logf(LogLevel::INFO, tag, __VA_ARGS__)
#define LOGW(tag, ...) ::logging::logf(LogLevel::WARN, tag, __VA_ARGS__)
#define LOGE(tag, ...) ::logging::logf(LogLevel::ERROR, tag, __VA_ARGS__)
