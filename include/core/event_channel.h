#pragma once

#include <mutex>
#include <string>

// Single pending one-shot event message. The next logger row consumes it; a newer
// post replaces an unconsumed one.
class EventChannel {
public:
  void post(const std::string& message);
  bool take(std::string& out);

private:
  std::mutex mutex_;
  std::string pending_;
  bool has_event_ {false};
};
