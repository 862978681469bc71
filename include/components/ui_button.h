#pragma once

#include <stdint.h>

#include "components/al2205_hub.h"
#include "core/device.h"

enum class ButtonAction : uint8_t { NONE = 0, START = 1, HOLD = 2, STOP = 3 };

inline const char* to_str(ButtonAction action) {
  switch (action) {
    case ButtonAction::NONE: return "NONE";
    case ButtonAction::START: return "START";
    case ButtonAction::HOLD: return "HOLD";
    case ButtonAction::STOP: return "STOP";
    default: return "UNKNOWN";
  }
}

// Operator push-button station wired into an AL2205 channel.
class UiButton : public IDevice {
public:
  UiButton(Al2205Hub& hub, int channel);

  static ButtonAction action_from_raw(uint16_t raw);
  bool read_action(ButtonAction& action, Fault* fault);

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  Al2205Hub& hub_;
  int channel_;
  ReportedValue reported_;
};
