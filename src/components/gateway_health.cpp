#include "components/gateway_health.h"

#include "core/clock.h"
#include "core/log.h"

void GatewayHealthComponent::set_status(HealthStatus status, Severity severity, const char* reason,
                                        uint32_t now_ms) {
  if (status != rep_.status) rep_.since_ms = now_ms;
  rep_.status = status;
  rep_.severity = severity;
  rep_.reason = reason;
}

void GatewayHealthComponent::configure(bool expected, bool required) {
  rep_ = HealthReport{};
  rep_.expected = expected;
  rep_.required = required;
  if (expected) {
    set_status(HealthStatus::MISSING, Severity::WARN, "init", millis_now());
  } else {
    set_status(HealthStatus::OK, Severity::INFO, "n/a", millis_now());
  }
}

bool GatewayHealthComponent::probe(uint32_t now_ms) {
  return tick(now_ms);
}

bool GatewayHealthComponent::tick(uint32_t now_ms) {
  if (!rep_.expected) {
    set_status(HealthStatus::OK, Severity::INFO, "disabled", now_ms);
    return true;
  }

  Fault fault;
  const bool was_up = rep_.status == HealthStatus::OK;
  if (!bus_.probe(&fault)) {
    if (was_up) LOGW("gateway", "unreachable: %s", fault.detail.c_str());
    set_status(HealthStatus::MISSING, rep_.required ? Severity::CRIT : Severity::WARN, "down", now_ms);
    return false;
  }

  if (!was_up) LOGI("gateway", "reachable");
  set_status(HealthStatus::OK, Severity::INFO, "up", now_ms);
  rep_.last_ok_ms = now_ms;
  return true;
}
