#pragma once

#include "core/health_manager.h"
#include "core/register_bus.h"

// Reachability of the AL1342 gateway, checked with a cheap register probe.
class GatewayHealthComponent : public IHealthComponent {
public:
  explicit GatewayHealthComponent(IRegisterBus& bus) : bus_(bus) {}

  const char* name() const override { return "gateway"; }

  void configure(bool expected, bool required) override;
  bool probe(uint32_t now_ms) override;
  bool tick(uint32_t now_ms) override;

  uint32_t stale_timeout_ms() const override { return 0; }
  HealthReport report() const override { return rep_; }

private:
  void set_status(HealthStatus status, Severity severity, const char* reason, uint32_t now_ms);

  IRegisterBus& bus_;
  HealthReport rep_ {};
};
