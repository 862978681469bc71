#pragma once

#include "core/health_manager.h"
#include "core/log.h"

class HealthRegistry {
public:
  explicit HealthRegistry(HealthManager& manager) : manager_(manager) {}

  bool register_component(IHealthComponent& component, bool expected, bool required) {
    component.configure(expected, required);
    if (!manager_.add(&component)) {
      LOGE("health", "cannot register %s, table full", component.name());
      return false;
    }
    return true;
  }

private:
  HealthManager& manager_;
};
