#include "core/device.h"

#include <cstdio>

void ReportedValue::record(float value, int decimals) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.*f", decimals, static_cast<double>(value));
  record_text(buf);
}

void ReportedValue::record_text(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_ = text;
  has_value_ = true;
}

bool ReportedValue::take(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_value_) return false;
  out = pending_;
  has_value_ = false;
  return true;
}
