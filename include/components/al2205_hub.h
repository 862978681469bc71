#pragma once

#include <stdint.h>

#include "core/device.h"
#include "core/register_bus.h"

// IFM AL2205 analog hub on one AL1342 port: eight 16-bit channels (X1.0..X1.7)
// behind the port's read base. No caching; every read is a round trip.
class Al2205Hub : public IDevice {
public:
  Al2205Hub(IRegisterBus& bus, int port, uint16_t base_register);

  // Resolves the base register for `port`; fails on an unmapped port.
  static std::unique_ptr<Al2205Hub> create(IRegisterBus& bus, int port, Fault* fault);

  bool read_channel(int index, uint16_t& raw, Fault* fault);
  static bool channel_register(uint16_t base_register, int index, uint16_t& reg, Fault* fault);

  int port() const { return port_; }
  uint16_t base_register() const { return base_register_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;

private:
  IRegisterBus& bus_;
  int port_;
  uint16_t base_register_;
};
