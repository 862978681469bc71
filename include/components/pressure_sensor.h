#pragma once

#include <stdint.h>

#include "components/al2205_hub.h"
#include "components/analog_span.h"
#include "core/device.h"

// PQ3834 pressure transmitter, 4-20 mA onto [min_psi, max_psi].
class PressureSensor : public IDevice {
public:
  static constexpr float DEFAULT_MIN_PSI = -15.0f;
  static constexpr float DEFAULT_MAX_PSI = 145.0f;

  PressureSensor(Al2205Hub& hub, int channel, float min_psi = DEFAULT_MIN_PSI,
                 float max_psi = DEFAULT_MAX_PSI);

  bool read_current_ma(float& ma, Fault* fault);
  bool read_pressure(float& psi, Fault* fault);

  float pressure_from_raw(uint16_t raw) const;

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  Al2205Hub& hub_;
  int channel_;
  AnalogSpan span_;
  ReportedValue reported_;
};
