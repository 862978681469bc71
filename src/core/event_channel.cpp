#include "core/event_channel.h"

#include "core/log.h"

void EventChannel::post(const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (has_event_) LOGD("event", "replacing unlogged event '%s'", pending_.c_str());
  pending_ = message;
  has_event_ = true;
  LOGI("event", "%s", message.c_str());
}

bool EventChannel::take(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_event_) return false;
  out = std::move(pending_);
  pending_.clear();
  has_event_ = false;
  return true;
}
