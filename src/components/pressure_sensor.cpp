#include "components/pressure_sensor.h"

#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "pressure";
} // namespace

PressureSensor::PressureSensor(Al2205Hub& hub, int channel, float min_psi, float max_psi)
  : hub_(hub), channel_(channel), span_(current_loop_span(min_psi, max_psi)) {}

float PressureSensor::pressure_from_raw(uint16_t raw) const {
  return span_.map(raw / ANALOG_RAW_DIVISOR);
}

bool PressureSensor::read_current_ma(float& ma, Fault* fault) {
  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  ma = raw / ANALOG_RAW_DIVISOR;
  return true;
}

bool PressureSensor::read_pressure(float& psi, Fault* fault) {
  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  psi = pressure_from_raw(raw);
  return true;
}

const DeviceTypeInfo& PressureSensor::type() const {
  return device_types::PRESSURE_SENSOR_PQ3834;
}

bool PressureSensor::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "read_pressure") == 0) {
    float psi = 0;
    if (!read_pressure(psi, fault)) return false;
    reported_.record(psi, 2);
    LOGI(TAG, "%s pressure %.2f psi", ctx.alias, static_cast<double>(psi));
    return true;
  }

  if (strcmp(command, "monitor_pressure") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(SENSOR_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) {
                  reading.valid = read_pressure(reading.value, f);
                  return reading.valid;
                },
                [&](const Reading& reading) {
                  if (!reading.valid) {
                    LOGW(TAG, "%s pressure unavailable", ctx.alias);
                    return;
                  }
                  reported_.record(reading.value, 2);
                  LOGI(TAG, "%s pressure %.2f psi", ctx.alias, static_cast<double>(reading.value));
                });
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "PressureSensor_PQ3834 has no command '%s'", command);
}
