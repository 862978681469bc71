#pragma once

#include <stdint.h>

#include "components/al2205_hub.h"
#include "components/analog_span.h"
#include "core/device.h"

enum class ForceUnit : uint8_t { LBF = 0, NEWTON = 1 };

// "lbf" or "N" (case-insensitive); anything else is a configuration fault.
bool parse_force_unit(const char* text, ForceUnit& unit, Fault* fault);
const char* to_str(ForceUnit unit);

// LCM300 load cell on an AL2205 channel: 0-5 V output, 50 lbf at 0 V and 0 lbf at 5 V.
class LoadCell : public IDevice {
public:
  LoadCell(Al2205Hub& hub, int channel);

  bool read_voltage(float& volts, Fault* fault);
  bool read_force(ForceUnit unit, float& force, Fault* fault);

  static float force_from_raw(uint16_t raw, ForceUnit unit);

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  static constexpr AnalogSpan VOLTS_TO_LBF {0.0f, 5.0f, 50.0f, 0.0f};

  Al2205Hub& hub_;
  int channel_;
  ReportedValue reported_;
};
