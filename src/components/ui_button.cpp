#include "components/ui_button.h"

#include <cstring>

#include "core/device_registry.h"
#include "core/log.h"

namespace {
constexpr uint16_t RAW_START = 257;
constexpr uint16_t RAW_HOLD = 1;
constexpr uint16_t RAW_STOP = 0;
} // namespace

UiButton::UiButton(Al2205Hub& hub, int channel) : hub_(hub), channel_(channel) {}

ButtonAction UiButton::action_from_raw(uint16_t raw) {
  switch (raw) {
    case RAW_START: return ButtonAction::START;
    case RAW_HOLD: return ButtonAction::HOLD;
    case RAW_STOP: return ButtonAction::STOP;
    default: return ButtonAction::NONE;
  }
}

bool UiButton::read_action(ButtonAction& action, Fault* fault) {
  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  action = action_from_raw(raw);
  return true;
}

const DeviceTypeInfo& UiButton::type() const {
  return device_types::UI_BUTTON;
}

bool UiButton::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  (void)params;
  if (strcmp(command, "read_button") == 0) {
    ButtonAction action = ButtonAction::NONE;
    if (!read_action(action, fault)) return false;
    if (action != ButtonAction::NONE) reported_.record_text(to_str(action));
    LOGI("button", "%s %s", ctx.alias, to_str(action));
    return true;
  }
  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "UI_Button has no command '%s'", command);
}
