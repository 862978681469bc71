#pragma once

#include <stdint.h>

#include "core/fault.h"

// Register-level access to the gateway. One instance is shared by every driver;
// implementations serialize concurrent callers internally.
class IRegisterBus {
public:
  virtual ~IRegisterBus() = default;

  virtual bool read_holding(uint16_t addr, uint16_t count, uint16_t* out, Fault* fault) = 0;

  // Single attempt; re-issuing an actuator command blindly is not safe.
  virtual bool write_holding(uint16_t addr, uint16_t value, Fault* fault) = 0;

  // Cheap reachability check used by the connection monitor.
  virtual bool probe(Fault* fault) = 0;
};

inline bool read_register(IRegisterBus& bus, uint16_t addr, uint16_t& value, Fault* fault) {
  return bus.read_holding(addr, 1, &value, fault);
}
