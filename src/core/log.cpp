#include "core/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace {
std::atomic<uint8_t> g_level {static_cast<uint8_t>(LogLevel::INFO)};
std::mutex g_out_mutex;

const char* level_prefix(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "D";
    case LogLevel::INFO: return "I";
    case LogLevel::WARN: return "W";
    case LogLevel::ERROR: return "E";
    default: return "?";
  }
}
} // namespace

void logging::set_level(LogLevel level) {
  g_level.store(static_cast<uint8_t>(level));
}

LogLevel logging::level() {
  return static_cast<LogLevel>(g_level.load());
}

void logging::configure_from_env() {
  const char* env = std::getenv("MRLF_LOG_LEVEL");
  if (!env) return;
  if (strcmp(env, "debug") == 0) {
    set_level(LogLevel::DEBUG);
  } else if (strcmp(env, "info") == 0) {
    set_level(LogLevel::INFO);
  } else if (strcmp(env, "warn") == 0) {
    set_level(LogLevel::WARN);
  } else if (strcmp(env, "error") == 0) {
    set_level(LogLevel::ERROR);
  }
}

void logging::logf(LogLevel level, const char* tag, const char* fmt, ...) {
  if (static_cast<uint8_t>(level) < g_level.load()) return;

  char msg[512];
  va_list args;
  va_start(args, fmt);
  vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(g_out_mutex);
  fprintf(stderr, "%s [%s] %s\n", level_prefix(level), tag, msg);
}
