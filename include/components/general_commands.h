#pragma once

#include "core/device.h"

// Script commands that are not bound to hardware: timed holds and event markers.
class GeneralCommands : public IDevice {
public:
  // Returns false when the wait was cut short by cancellation.
  static bool hold(float seconds, const std::atomic<bool>* cancel);

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
};
