#include "components/general_commands.h"

#include <cstring>

#include "core/clock.h"
#include "core/device_registry.h"
#include "core/event_channel.h"
#include "core/log.h"
#include "core/step_params.h"

bool GeneralCommands::hold(float seconds, const std::atomic<bool>* cancel) {
  if (!(seconds > 0)) return true;
  return delay_ms_cancellable(static_cast<uint32_t>(seconds * 1000.0f), cancel);
}

const DeviceTypeInfo& GeneralCommands::type() const {
  return device_types::GENERAL;
}

bool GeneralCommands::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "hold") == 0) {
    float seconds = 0;
    if (!step_params::get_float(params, "seconds", seconds, fault)) return false;
    if (seconds < 0) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "bad_param", "hold seconds must be >= 0");
    }
    LOGI("general", "hold %.2f s", static_cast<double>(seconds));
    if (!hold(seconds, ctx.cancel)) LOGI("general", "hold interrupted");
    return true;
  }

  if (strcmp(command, "log_event") == 0) {
    std::string message;
    if (!step_params::get_string(params, "message", message, fault)) return false;
    if (ctx.events) {
      ctx.events->post(message);
    } else {
      LOGI("event", "%s", message.c_str());
    }
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "General has no command '%s'", command);
}
