#include "core/link_monitor.h"

#include <chrono>

#include "core/clock.h"
#include "core/log.h"

LinkMonitor::LinkMonitor(HealthManager& health, uint32_t period_ms, Callback on_lost, Callback on_restored)
  : health_(health), period_ms_(period_ms), on_lost_(std::move(on_lost)), on_restored_(std::move(on_restored)) {}

LinkMonitor::~LinkMonitor() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (task_.joinable()) task_.join();
}

void LinkMonitor::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!task_done_) return;
  if (task_.joinable()) task_.join();
  stop_requested_ = false;
  task_done_ = false;
  task_ = std::thread([this] { run(); });
}

bool LinkMonitor::stop(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  stop_requested_ = true;
  cv_.notify_all();
  if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return task_done_; })) {
    LOGW("link", "monitor did not stop within %u ms", timeout_ms);
    return false;
  }
  lock.unlock();
  if (task_.joinable()) task_.join();
  return true;
}

bool LinkMonitor::link_ok() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return link_ok_;
}

void LinkMonitor::poll(uint32_t now_ms) {
  health_.tick_all(now_ms);
  const bool ok = health_.system_health().run_allowed;

  bool was_ok = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_ok = link_ok_;
    link_ok_ = ok;
  }

  if (was_ok && !ok) {
    LOGW("link", "connection lost");
    if (on_lost_) on_lost_();
  } else if (!was_ok && ok) {
    LOGI("link", "connection restored");
    if (on_restored_) on_restored_();
  }
}

void LinkMonitor::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    lock.unlock();
    poll(millis_now());
    lock.lock();
    cv_.wait_for(lock, std::chrono::milliseconds(period_ms_), [this] { return stop_requested_; });
  }
  task_done_ = true;
  cv_.notify_all();
}
