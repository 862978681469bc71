#include "components/load_cell.h"

#include <strings.h>

#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "loadcell";
} // namespace

bool parse_force_unit(const char* text, ForceUnit& unit, Fault* fault) {
  if (strcasecmp(text, "lbf") == 0) {
    unit = ForceUnit::LBF;
    return true;
  }
  if (strcasecmp(text, "n") == 0) {
    unit = ForceUnit::NEWTON;
    return true;
  }
  return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_unit",
                     "invalid unit '%s', use 'lbf' or 'N'", text);
}

const char* to_str(ForceUnit unit) {
  return unit == ForceUnit::NEWTON ? "N" : "lbf";
}

LoadCell::LoadCell(Al2205Hub& hub, int channel) : hub_(hub), channel_(channel) {}

float LoadCell::force_from_raw(uint16_t raw, ForceUnit unit) {
  const float lbf = VOLTS_TO_LBF.map(raw / ANALOG_RAW_DIVISOR);
  return unit == ForceUnit::NEWTON ? lbf * units::LBF_TO_N : lbf;
}

bool LoadCell::read_voltage(float& volts, Fault* fault) {
  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  volts = raw / ANALOG_RAW_DIVISOR;
  return true;
}

bool LoadCell::read_force(ForceUnit unit, float& force, Fault* fault) {
  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  force = force_from_raw(raw, unit);
  return true;
}

const DeviceTypeInfo& LoadCell::type() const {
  return device_types::LOAD_CELL_LCM300;
}

bool LoadCell::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  std::string unit_text = "lbf";
  if (step_params::has(params, "unit") && !step_params::get_string(params, "unit", unit_text, fault)) {
    return false;
  }
  ForceUnit unit = ForceUnit::LBF;
  if (!parse_force_unit(unit_text.c_str(), unit, fault)) return false;

  if (strcmp(command, "read_force") == 0) {
    float force = 0;
    if (!read_force(unit, force, fault)) return false;
    reported_.record(force, 3);
    LOGI(TAG, "%s force %.3f %s", ctx.alias, static_cast<double>(force), to_str(unit));
    return true;
  }

  if (strcmp(command, "monitor_force") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(SENSOR_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) {
                  reading.valid = read_force(unit, reading.value, f);
                  return reading.valid;
                },
                [&](const Reading& reading) {
                  if (!reading.valid) {
                    LOGW(TAG, "%s force unavailable", ctx.alias);
                    return;
                  }
                  reported_.record(reading.value, 3);
                  LOGI(TAG, "%s force %.3f %s", ctx.alias, static_cast<double>(reading.value), to_str(unit));
                });
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "LoadCell_LCM300 has no command '%s'", command);
}
