#include "core/health_manager.h"

#include "core/log.h"

bool HealthManager::add(IHealthComponent* c) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  if (!c || n_ >= MAX_COMPONENTS) return false;
  comps_[n_++] = c;
  return true;
}

void HealthManager::clear() {
  std::lock_guard<std::mutex> lock(table_mutex_);
  for (IHealthComponent*& c : comps_) c = nullptr;
  n_ = 0;
  std::lock_guard<std::mutex> sys_lock(mutex_);
  sys_ = SystemHealth{};
}

size_t HealthManager::count() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return n_;
}

IHealthComponent* HealthManager::component(size_t i) const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return (i < n_) ? comps_[i] : nullptr;
}

bool HealthManager::is_bad(HealthStatus s) {
  switch (s) {
    case HealthStatus::MISSING:
    case HealthStatus::STALE:
    case HealthStatus::ERROR:
      return true;
    default:
      return false;
  }
}

HealthStatus HealthManager::effective_status(const IHealthComponent& c, uint32_t now_ms) {
  const HealthReport r = c.report();
  // A component with no success inside its stale window is STALE whatever it last reported,
  // unless that report is OK.
  const uint32_t window = c.stale_timeout_ms();
  if (r.status == HealthStatus::OK || window == 0 || r.last_ok_ms == 0) return r.status;
  return (now_ms - r.last_ok_ms > window) ? HealthStatus::STALE : r.status;
}

void HealthManager::tick_all(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  for (size_t i = 0; i < n_; ++i) {
    IHealthComponent* c = comps_[i];
    // A failed check is already folded into the component's report.
    if (c && c->report().expected && !c->tick(now_ms)) LOGD("health", "%s check failed", c->name());
  }
  evaluate_locked(now_ms);
}

void HealthManager::evaluate(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  evaluate_locked(now_ms);
}

void HealthManager::evaluate_locked(uint32_t now_ms) {
  SystemHealth next {};

  for (size_t i = 0; i < n_; ++i) {
    const IHealthComponent* c = comps_[i];
    if (!c) continue;
    const HealthReport r = c->report();
    if (!r.expected || !is_bad(effective_status(*c, now_ms))) continue;

    if (r.required) {
      next.crit_count++;
    } else {
      next.warn_count++;
    }
  }

  if (next.crit_count > 0) {
    next.system_state = HealthStatus::ERROR;
    next.run_allowed = false;
  } else if (next.warn_count > 0) {
    next.system_state = HealthStatus::DEGRADED;
  }
  next.degraded = next.system_state != HealthStatus::OK;

  std::lock_guard<std::mutex> lock(mutex_);
  sys_ = next;
}

SystemHealth HealthManager::system_health() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sys_;
}
