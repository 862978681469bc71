#pragma once

#include "components/process_data.h"
#include "core/device.h"

// Linear position sensor reporting over IO-Link: [0:2] int16, 0.01 mm per count.
class PositionSensorIol : public IDevice {
public:
  PositionSensorIol(IRegisterBus& bus, int port, uint16_t status_register, uint16_t pdin_register,
                    const IolinkPortOptions& options);

  static Reading position_mm(const ProcessDataFrame& frame);
  bool read_position(Reading& mm, Fault* fault);

  IolinkPort& iolink() { return iolink_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  IolinkPort iolink_;
  ReportedValue reported_;
};
