#pragma once

#include "components/process_data.h"
#include "core/device.h"

// IFM SD9500 flow/pressure/temperature meter over IO-Link.
// Frame: [4:6] flow int16 0.1 m3/h, [8:10] temperature int16 0.01 C, [12:14] pressure int16 0.01 bar.
class FlowPressureSd9500 : public IDevice {
public:
  FlowPressureSd9500(IRegisterBus& bus, int port, uint16_t status_register, uint16_t pdin_register,
                     const IolinkPortOptions& options);

  static Reading flow_cfm(const ProcessDataFrame& frame);
  static Reading temperature_c(const ProcessDataFrame& frame);
  static Reading pressure_psi(const ProcessDataFrame& frame);

  bool read_flow(Reading& cfm, Fault* fault);
  bool read_pressure(Reading& psi, Fault* fault);
  bool read_temperature(Reading& celsius, Fault* fault);

  IolinkPort& iolink() { return iolink_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  IolinkPort iolink_;
  ReportedValue reported_;
};
