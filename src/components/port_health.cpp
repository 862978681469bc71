#include "components/port_health.h"

#include "components/process_data.h"
#include "core/bench_config.h"
#include "core/clock.h"
#include "core/log.h"

namespace {
constexpr const char* TAG = "health";
} // namespace

IolinkPortHealth::IolinkPortHealth(IRegisterBus& bus, int port, uint16_t status_register)
  : bus_(bus), port_(port), status_register_(status_register), name_(gateway_slot_label(port)) {}

void IolinkPortHealth::set_status(HealthStatus status, Severity severity, const char* reason, uint32_t now_ms) {
  if (status != rep_.status) {
    rep_.since_ms = now_ms;
    if (status == HealthStatus::OK) {
      LOGI(TAG, "%s ok", name_.c_str());
    } else {
      LOGW(TAG, "%s %s (%s)", name_.c_str(), to_str(status), reason);
    }
  }
  rep_.status = status;
  rep_.severity = severity;
  rep_.reason = reason;
}

void IolinkPortHealth::configure(bool expected, bool required) {
  rep_ = HealthReport{};
  rep_.expected = expected;
  rep_.required = required;
  rep_.status = expected ? HealthStatus::MISSING : HealthStatus::OK;
  rep_.reason = expected ? "init" : "n/a";
  rep_.since_ms = millis_now();
}

bool IolinkPortHealth::tick(uint32_t now_ms) {
  uint16_t status = 0;
  Fault fault;
  if (!read_register(bus_, status_register_, status, &fault)) {
    // Last good PQI ages out through the stale window.
    set_status(HealthStatus::DEGRADED, Severity::WARN, "pqi_unreadable", now_ms);
    return false;
  }

  fault.clear();
  if (!check_pqi_byte(static_cast<uint8_t>(status & 0xFF), port_, &fault)) {
    set_status(HealthStatus::ERROR, rep_.required ? Severity::CRIT : Severity::WARN, fault.reason, now_ms);
    return false;
  }
  set_status(HealthStatus::OK, Severity::INFO, "iolink", now_ms);
  rep_.last_ok_ms = now_ms;
  return true;
}
