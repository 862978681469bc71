#pragma once

#include <stddef.h>

#include "core/device.h"
#include "core/register_bus.h"

class Al2205Hub;
class CalibrationStore;
class DeadlineScheduler;

// Everything a factory may need to build one driver instance.
struct DeviceBuildContext {
  IRegisterBus* bus {nullptr};
  int port {0};                           // AL1342 port for gateway-attached devices
  int channel {-1};                       // AL2205 channel for hub-attached devices
  Al2205Hub* hub {nullptr};
  CalibrationStore* calibration {nullptr};
  DeadlineScheduler* scheduler {nullptr};
  const ParamMap* options {nullptr};      // per-instance options from the bench config
};

// Compile-time table of supported device types: identifier, attachment, factory and
// the commands a script may call on an instance.
namespace device_types {
extern const DeviceTypeInfo AL2205_HUB;
extern const DeviceTypeInfo LOAD_CELL_LCM300;
extern const DeviceTypeInfo PRESSURE_SENSOR_PQ3834;
extern const DeviceTypeInfo POSITION_SENSOR_SDAT;
extern const DeviceTypeInfo UI_BUTTON;
extern const DeviceTypeInfo FLOW_SENSOR_SD6020;
extern const DeviceTypeInfo FLOW_PRESSURE_SD9500;
extern const DeviceTypeInfo POSITION_SENSOR_IOL;
extern const DeviceTypeInfo VALVE_BANK_SY3000;
extern const DeviceTypeInfo PRESSURE_REGULATOR_ITV1050;
extern const DeviceTypeInfo GENERAL;
} // namespace device_types

namespace device_registry {

size_t count();
const DeviceTypeInfo& at(size_t index);
const DeviceTypeInfo* find(const char* type_id);
const CommandInfo* find_command(const DeviceTypeInfo& type, const char* command);

// IO-Link sensors read through the port's process data (and its PQI).
bool uses_process_data(const DeviceTypeInfo& type);

} // namespace device_registry
