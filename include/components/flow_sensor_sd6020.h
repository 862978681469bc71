#pragma once

#include "components/process_data.h"
#include "core/device.h"

// IFM SD6020 compressed-air meter over IO-Link.
// Frame: [0:4] totaliser float32 m3, [4:6] flow int16 0.01 m3/h, [6:8] temperature int16 0.01 C.
class FlowSensorSd6020 : public IDevice {
public:
  FlowSensorSd6020(IRegisterBus& bus, int port, uint16_t status_register, uint16_t pdin_register,
                   const IolinkPortOptions& options);

  static Reading flow_cfm(const ProcessDataFrame& frame);
  static Reading temperature_c(const ProcessDataFrame& frame);
  static Reading totaliser_m3(const ProcessDataFrame& frame);

  bool read_flow(Reading& cfm, Fault* fault);
  bool read_temperature(Reading& celsius, Fault* fault);
  bool read_totaliser(Reading& m3, Fault* fault);

  IolinkPort& iolink() { return iolink_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  bool dump_raw(Fault* fault);

  IolinkPort iolink_;
  ReportedValue reported_;
};
