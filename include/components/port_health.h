#pragma once

#include <stdint.h>

#include <string>

#include "core/health_manager.h"
#include "core/register_bus.h"

// PQI of one AL1342 port carrying an IO-Link sensor. Optional: a disconnected sensor
// degrades the bench but does not stop a run. A PQI that cannot be read for
// stale_timeout_ms turns STALE.
class IolinkPortHealth : public IHealthComponent {
public:
  static constexpr uint32_t STALE_TIMEOUT_MS = 5000;

  IolinkPortHealth(IRegisterBus& bus, int port, uint16_t status_register);

  const char* name() const override { return name_.c_str(); }

  void configure(bool expected, bool required) override;
  bool probe(uint32_t now_ms) override { return tick(now_ms); }
  bool tick(uint32_t now_ms) override;

  uint32_t stale_timeout_ms() const override { return STALE_TIMEOUT_MS; }
  HealthReport report() const override { return rep_; }

private:
  void set_status(HealthStatus status, Severity severity, const char* reason, uint32_t now_ms);

  IRegisterBus& bus_;
  int port_;
  uint16_t status_register_;
  std::string name_;
  HealthReport rep_ {};
};
