#include "core/device_registry.h"

#include <cstring>

#include "components/al2205_hub.h"
#include "components/flow_pressure_sd9500.h"
#include "components/flow_sensor_sd6020.h"
#include "components/general_commands.h"
#include "components/load_cell.h"
#include "components/position_sensor.h"
#include "components/position_sensor_iol.h"
#include "components/pressure_regulator.h"
#include "components/pressure_sensor.h"
#include "components/ui_button.h"
#include "components/valve_bank.h"
#include "core/port_map.h"
#include "core/step_params.h"

namespace {

// -------- Command tables --------
constexpr CommandInfo HUB_COMMANDS[] = {
  {"read_index", "X1_index", "read_index(X1_index) - raw count of hub channel X1.<index> (0-7)"},
};

constexpr CommandInfo LOAD_CELL_COMMANDS[] = {
  {"read_force", "unit?", "read_force(unit=\"lbf\") - single force reading in lbf or N"},
  {"monitor_force", "unit?,duration?",
   "monitor_force(unit=\"lbf\", duration=None) - report force every 0.5 s until stopped or duration elapses"},
};

constexpr CommandInfo PRESSURE_SENSOR_COMMANDS[] = {
  {"read_pressure", "", "read_pressure() - single pressure reading in psi"},
  {"monitor_pressure", "duration?", "monitor_pressure(duration=None) - report pressure every 0.5 s"},
};

constexpr CommandInfo POSITION_SENSOR_COMMANDS[] = {
  {"read_position", "", "read_position() - calibrated position in mm (0.01 mm resolution)"},
  {"monitor_position", "duration?", "monitor_position(duration=None) - report position every 0.25 s"},
  {"calibrate_min", "", "calibrate_min() - store the current raw count as the retracted end"},
  {"calibrate_max", "", "calibrate_max() - store the current raw count as the extended end"},
  {"set_stroke_length", "length_mm", "set_stroke_length(length_mm) - physical stroke mapped onto min..max"},
};

constexpr CommandInfo UI_BUTTON_COMMANDS[] = {
  {"read_button", "", "read_button() - START, HOLD, STOP or NONE"},
};

constexpr CommandInfo SD6020_COMMANDS[] = {
  {"read_flow", "", "read_flow() - flow in CFM"},
  {"read_temperature", "", "read_temperature() - medium temperature in C"},
  {"read_totaliser", "", "read_totaliser() - consumed volume in m3"},
  {"monitor_flow", "duration?", "monitor_flow(duration=None) - report flow every 0.5 s"},
  {"read_raw", "", "read_raw() - PQI, frame length, byte order and raw counts"},
  {"refresh_config", "", "refresh_config() - re-read the master's frame length and byte order"},
};

constexpr CommandInfo SD9500_COMMANDS[] = {
  {"read_flow", "", "read_flow() - flow in CFM"},
  {"read_pressure", "", "read_pressure() - line pressure in psi"},
  {"read_temperature", "", "read_temperature() - medium temperature in C"},
  {"monitor", "duration?", "monitor(duration=None) - report flow and pressure every 0.5 s"},
  {"refresh_config", "", "refresh_config() - re-read the master's frame length and byte order"},
};

constexpr CommandInfo POSITION_IOL_COMMANDS[] = {
  {"read_position", "", "read_position() - position in mm"},
  {"monitor_position", "duration?", "monitor_position(duration=None) - report position every 0.25 s"},
  {"refresh_config", "", "refresh_config() - re-read the master's frame length and byte order"},
};

constexpr CommandInfo VALVE_BANK_COMMANDS[] = {
  {"valve_on", "valve,duration?",
   "valve_on(valve, duration=None) - e.g. valve_on(\"1.A\", duration=3); the paired valve is turned off"},
  {"valve_off", "valves", "valve_off(valves) - e.g. valve_off(\"1.A, 1.B\")"},
  {"all_off", "", "all_off() - turn off every valve"},
};

constexpr CommandInfo REGULATOR_COMMANDS[] = {
  {"set_pressure", "target_psi", "set_pressure(target_psi) - e.g. set_pressure(25); clamped to the regulator range"},
  {"read_pressure", "", "read_pressure() - feedback pressure in psi"},
};

constexpr CommandInfo GENERAL_COMMANDS[] = {
  {"hold", "seconds", "hold(seconds) - wait; interrupted by stop"},
  {"log_event", "message", "log_event(message) - tag the next log row with message"},
};

// -------- Factories --------
bool require_bus(const DeviceBuildContext& ctx, Fault* fault) {
  if (ctx.bus) return true;
  return raise_fault(fault, FaultKind::CONFIGURATION, "no_transport", "device needs a gateway connection");
}

bool require_hub_channel(const DeviceBuildContext& ctx, Fault* fault) {
  if (!ctx.hub) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "no_hub",
                       "analog device on X1.%d but no AL2205 hub is configured", ctx.channel);
  }
  uint16_t reg = 0;
  return Al2205Hub::channel_register(ctx.hub->base_register(), ctx.channel, reg, fault);
}

std::unique_ptr<IDevice> make_hub(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_bus(ctx, fault)) return nullptr;
  return Al2205Hub::create(*ctx.bus, ctx.port, fault);
}

std::unique_ptr<IDevice> make_load_cell(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_hub_channel(ctx, fault)) return nullptr;
  return std::make_unique<LoadCell>(*ctx.hub, ctx.channel);
}

std::unique_ptr<IDevice> make_pressure_sensor(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_hub_channel(ctx, fault)) return nullptr;
  float min_psi = PressureSensor::DEFAULT_MIN_PSI;
  float max_psi = PressureSensor::DEFAULT_MAX_PSI;
  if (ctx.options) {
    if (step_params::has(*ctx.options, "min_psi") &&
        !step_params::get_float(*ctx.options, "min_psi", min_psi, fault)) {
      return nullptr;
    }
    if (step_params::has(*ctx.options, "max_psi") &&
        !step_params::get_float(*ctx.options, "max_psi", max_psi, fault)) {
      return nullptr;
    }
  }
  return std::make_unique<PressureSensor>(*ctx.hub, ctx.channel, min_psi, max_psi);
}

std::unique_ptr<IDevice> make_position_sensor(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_hub_channel(ctx, fault)) return nullptr;
  if (!ctx.calibration) {
    raise_fault(fault, FaultKind::CONFIGURATION, "no_calibration_store", "position sensor needs a calibration store");
    return nullptr;
  }
  return std::make_unique<PositionSensor>(*ctx.hub, ctx.channel, *ctx.calibration);
}

std::unique_ptr<IDevice> make_ui_button(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_hub_channel(ctx, fault)) return nullptr;
  return std::make_unique<UiButton>(*ctx.hub, ctx.channel);
}

template <typename Sensor>
std::unique_ptr<IDevice> make_iolink(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_bus(ctx, fault)) return nullptr;
  uint16_t status_reg = 0;
  uint16_t pdin_reg = 0;
  if (!IolinkPort::resolve(ctx.port, status_reg, pdin_reg, fault)) return nullptr;
  IolinkPortOptions options;
  if (!parse_iolink_options(ctx.options, options, fault)) return nullptr;
  return std::make_unique<Sensor>(*ctx.bus, ctx.port, status_reg, pdin_reg, options);
}

std::unique_ptr<IDevice> make_valve_bank(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_bus(ctx, fault)) return nullptr;
  if (!ctx.scheduler) {
    raise_fault(fault, FaultKind::CONFIGURATION, "no_scheduler", "valve bank needs a timer scheduler");
    return nullptr;
  }
  uint16_t reg = 0;
  if (!port_map::write_register(ctx.port, reg, fault)) return nullptr;
  return std::make_unique<ValveBank>(*ctx.bus, ctx.port, reg, *ctx.scheduler);
}

std::unique_ptr<IDevice> make_regulator(const DeviceBuildContext& ctx, Fault* fault) {
  if (!require_bus(ctx, fault)) return nullptr;
  uint16_t command_reg = 0;
  uint16_t feedback_reg = 0;
  if (!port_map::write_register(ctx.port, command_reg, fault)) return nullptr;
  if (!port_map::read_register(ctx.port, feedback_reg, fault)) return nullptr;
  RegulatorOptions options;
  if (!parse_regulator_options(ctx.options, options, fault)) return nullptr;
  return std::make_unique<PressureRegulator>(*ctx.bus, ctx.port, command_reg, feedback_reg, options);
}

std::unique_ptr<IDevice> make_general(const DeviceBuildContext& ctx, Fault* fault) {
  (void)ctx;
  (void)fault;
  return std::make_unique<GeneralCommands>();
}

template <size_t N>
constexpr size_t count_of(const CommandInfo (&)[N]) {
  return N;
}

} // namespace

namespace device_types {
const DeviceTypeInfo AL2205_HUB {
  "AL2205_Hub", DeviceAttach::GATEWAY_PORT, make_hub, HUB_COMMANDS, count_of(HUB_COMMANDS)};
const DeviceTypeInfo LOAD_CELL_LCM300 {
  "LoadCell_LCM300", DeviceAttach::HUB_CHANNEL, make_load_cell, LOAD_CELL_COMMANDS,
  count_of(LOAD_CELL_COMMANDS)};
const DeviceTypeInfo PRESSURE_SENSOR_PQ3834 {
  "PressureSensor_PQ3834", DeviceAttach::HUB_CHANNEL, make_pressure_sensor, PRESSURE_SENSOR_COMMANDS,
  count_of(PRESSURE_SENSOR_COMMANDS)};
const DeviceTypeInfo POSITION_SENSOR_SDAT {
  "PositionSensor_SDAT_MHS_M160", DeviceAttach::HUB_CHANNEL, make_position_sensor, POSITION_SENSOR_COMMANDS,
  count_of(POSITION_SENSOR_COMMANDS)};
const DeviceTypeInfo UI_BUTTON {
  "UI_Button", DeviceAttach::HUB_CHANNEL, make_ui_button, UI_BUTTON_COMMANDS, count_of(UI_BUTTON_COMMANDS)};
const DeviceTypeInfo FLOW_SENSOR_SD6020 {
  "FlowSensor_SD6020", DeviceAttach::GATEWAY_PORT, make_iolink<FlowSensorSd6020>, SD6020_COMMANDS,
  count_of(SD6020_COMMANDS)};
const DeviceTypeInfo FLOW_PRESSURE_SD9500 {
  "FlowPressure_SD9500", DeviceAttach::GATEWAY_PORT, make_iolink<FlowPressureSd9500>, SD9500_COMMANDS,
  count_of(SD9500_COMMANDS)};
const DeviceTypeInfo POSITION_SENSOR_IOL {
  "PositionSensor_IOL", DeviceAttach::GATEWAY_PORT, make_iolink<PositionSensorIol>, POSITION_IOL_COMMANDS,
  count_of(POSITION_IOL_COMMANDS)};
const DeviceTypeInfo VALVE_BANK_SY3000 {
  "ValveBank_SY3000", DeviceAttach::GATEWAY_PORT, make_valve_bank, VALVE_BANK_COMMANDS,
  count_of(VALVE_BANK_COMMANDS)};
const DeviceTypeInfo PRESSURE_REGULATOR_ITV1050 {
  "PressureRegulator_ITV_1050", DeviceAttach::GATEWAY_PORT, make_regulator, REGULATOR_COMMANDS,
  count_of(REGULATOR_COMMANDS)};
const DeviceTypeInfo GENERAL {
  "General", DeviceAttach::NONE, make_general, GENERAL_COMMANDS, count_of(GENERAL_COMMANDS)};
} // namespace device_types

namespace {
const DeviceTypeInfo* const ALL_TYPES[] = {
  &device_types::AL2205_HUB,
  &device_types::LOAD_CELL_LCM300,
  &device_types::PRESSURE_SENSOR_PQ3834,
  &device_types::POSITION_SENSOR_SDAT,
  &device_types::UI_BUTTON,
  &device_types::FLOW_SENSOR_SD6020,
  &device_types::FLOW_PRESSURE_SD9500,
  &device_types::POSITION_SENSOR_IOL,
  &device_types::VALVE_BANK_SY3000,
  &device_types::PRESSURE_REGULATOR_ITV1050,
  &device_types::GENERAL,
};
} // namespace

size_t device_registry::count() {
  return sizeof(ALL_TYPES) / sizeof(ALL_TYPES[0]);
}

const DeviceTypeInfo& device_registry::at(size_t index) {
  return *ALL_TYPES[index];
}

const DeviceTypeInfo* device_registry::find(const char* type_id) {
  for (const DeviceTypeInfo* type : ALL_TYPES) {
    if (strcmp(type->type_id, type_id) == 0) return type;
  }
  return nullptr;
}

const CommandInfo* device_registry::find_command(const DeviceTypeInfo& type, const char* command) {
  for (size_t i = 0; i < type.command_count; ++i) {
    if (strcmp(type.commands[i].name, command) == 0) return &type.commands[i];
  }
  return nullptr;
}

bool device_registry::uses_process_data(const DeviceTypeInfo& type) {
  return &type == &device_types::FLOW_SENSOR_SD6020 || &type == &device_types::FLOW_PRESSURE_SD9500 ||
         &type == &device_types::POSITION_SENSOR_IOL;
}
