#pragma once

#include "core/health_manager.h"

// Health component whose report is set directly by the test.
class FakeHealthComponent : public IHealthComponent {
public:
  HealthReport rep {};
  uint32_t stale_ms {0};

  FakeHealthComponent(bool required, HealthStatus status, uint32_t last_ok_ms) {
    configure(true, required);
    rep.status = status;
    rep.last_ok_ms = last_ok_ms;
  }

  const char* name() const override { return "fake"; }
  void configure(bool expected, bool required) override {
    rep.expected = expected;
    rep.required = required;
  }
  bool probe(uint32_t now_ms) override { return tick(now_ms); }
  bool tick(uint32_t) override { return rep.status == HealthStatus::OK; }
  uint32_t stale_timeout_ms() const override { return stale_ms; }
  HealthReport report() const override { return rep; }
};
