#pragma once

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "core/fault.h"

class EventChannel;
class IDevice;
struct DeviceBuildContext;

using ParamMap = std::map<std::string, std::string>;

// A decoded value; valid=false means "unavailable" (e.g. frame too short), not an error.
struct Reading {
  float value {0};
  bool valid {false};
};

struct StepContext {
  const char* alias {""};
  EventChannel* events {nullptr};
  const std::atomic<bool>* cancel {nullptr};  // set when the run is stopping
};

struct CommandInfo {
  const char* name;
  const char* params;  // comma separated; a trailing '?' marks an optional parameter
  const char* usage;
};

enum class DeviceAttach : uint8_t {
  NONE = 0,          // virtual (General)
  GATEWAY_PORT = 1,  // AL1342 port X01..X08
  HUB_CHANNEL = 2    // AL2205 channel X1.0..X1.7
};

using DeviceFactory = std::unique_ptr<IDevice> (*)(const DeviceBuildContext& ctx, Fault* fault);

struct DeviceTypeInfo {
  const char* type_id;
  DeviceAttach attach;
  DeviceFactory factory;
  const CommandInfo* commands;
  size_t command_count;
};

class IDevice {
public:
  virtual ~IDevice() = default;

  virtual const DeviceTypeInfo& type() const = 0;

  // Runs one script command. Parameters arrive as text exactly as authored.
  virtual bool execute(const char* command, const ParamMap& params, StepContext& ctx,
                       Fault* fault) = 0;

  // Current loggable value for the csv logger; false means "-" for this row.
  virtual bool log_value(std::string& out) {
    (void)out;
    return false;
  }

  // Re-issues retained outputs (regulator setpoints) after a connectivity blip.
  virtual bool reapply_outputs(Fault* fault) {
    (void)fault;
    return true;
  }
};

// Last explicitly recorded sensor reading. Consumed by the logger: it shows in one
// row and is then cleared.
class ReportedValue {
public:
  void record(float value, int decimals);
  void record_text(const std::string& text);
  bool take(std::string& out);

private:
  std::mutex mutex_;
  std::string pending_;
  bool has_value_ {false};
};
