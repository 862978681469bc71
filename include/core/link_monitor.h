#pragma once

#include <stdint.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "core/health_manager.h"

// Periodically ticks the health components and reports edges of run_allowed:
// on_lost when a required component goes bad, on_restored when everything is back.
class LinkMonitor {
public:
  using Callback = std::function<void()>;

  LinkMonitor(HealthManager& health, uint32_t period_ms, Callback on_lost, Callback on_restored);
  ~LinkMonitor();

  LinkMonitor(const LinkMonitor&) = delete;
  LinkMonitor& operator=(const LinkMonitor&) = delete;

  void start();
  bool stop(uint32_t timeout_ms);

  // One check cycle; the task calls this every period.
  void poll(uint32_t now_ms);

  bool link_ok() const;

private:
  void run();

  HealthManager& health_;
  uint32_t period_ms_;
  Callback on_lost_;
  Callback on_restored_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool link_ok_ {true};
  bool stop_requested_ {false};
  bool task_done_ {true};
  std::thread task_;
};
