#include "components/position_sensor.h"

#include <cmath>
#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "position";

std::string key_for_channel(int channel) {
  return "X1." + std::to_string(channel);
}
} // namespace

PositionSensor::PositionSensor(Al2205Hub& hub, int channel, CalibrationStore& store)
  : hub_(hub), channel_(channel), store_(store), key_(key_for_channel(channel)) {
  const CalibrationRecord cal = store_.get(key_);
  if (cal.has_stroke && cal.stroke > 0) stroke_mm_ = cal.stroke;
}

bool PositionSensor::position_from_raw(uint16_t raw, const CalibrationRecord& cal, float stroke_mm,
                                       float& mm, Fault* fault) {
  if (!cal.has_min || !cal.has_max) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "not_calibrated",
                       "sensor not calibrated, set min and max first");
  }
  const float span = cal.max - cal.min;
  if (span == 0.0f) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "zero_span",
                       "zero calibration span (min == max == %.0f)", static_cast<double>(cal.min));
  }

  float position = (static_cast<float>(raw) - cal.min) / span * stroke_mm;
  if (position < 0.0f) position = 0.0f;
  if (position > stroke_mm) position = stroke_mm;
  mm = std::round(position * 100.0f) / 100.0f;
  return true;
}

bool PositionSensor::capture(const char* field, uint16_t& raw, Fault* fault) {
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  if (!store_.set_value(key_, field, static_cast<float>(raw), fault)) return false;
  LOGI(TAG, "%s %s captured at raw=%u", key_.c_str(), field, raw);
  return true;
}

bool PositionSensor::calibrate_min(uint16_t& raw, Fault* fault) {
  return capture("min", raw, fault);
}

bool PositionSensor::calibrate_max(uint16_t& raw, Fault* fault) {
  return capture("max", raw, fault);
}

bool PositionSensor::set_stroke_length(float mm, Fault* fault) {
  if (!(mm > 0.0f)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_stroke",
                       "stroke length must be positive, got %.2f", static_cast<double>(mm));
  }
  if (!store_.set_value(key_, "stroke", mm, fault)) return false;
  stroke_mm_ = mm;
  LOGI(TAG, "%s stroke set to %.2f mm", key_.c_str(), static_cast<double>(mm));
  return true;
}

bool PositionSensor::read_position(float& mm, Fault* fault) {
  const CalibrationRecord cal = store_.get(key_);
  // Calibration is checked before the bus is read.
  if (!cal.has_min || !cal.has_max) return position_from_raw(0, cal, stroke_mm_, mm, fault);

  uint16_t raw = 0;
  if (!hub_.read_channel(channel_, raw, fault)) return false;
  return position_from_raw(raw, cal, stroke_mm_, mm, fault);
}

const DeviceTypeInfo& PositionSensor::type() const {
  return device_types::POSITION_SENSOR_SDAT;
}

bool PositionSensor::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "read_position") == 0) {
    float mm = 0;
    if (!read_position(mm, fault)) return false;
    reported_.record(mm, 2);
    LOGI(TAG, "%s position %.2f mm", ctx.alias, static_cast<double>(mm));
    return true;
  }

  if (strcmp(command, "monitor_position") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(POSITION_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) {
                  reading.valid = read_position(reading.value, f);
                  return reading.valid;
                },
                [&](const Reading& reading) {
                  if (!reading.valid) {
                    LOGW(TAG, "%s position unavailable", ctx.alias);
                    return;
                  }
                  reported_.record(reading.value, 2);
                  LOGI(TAG, "%s position %.2f mm", ctx.alias, static_cast<double>(reading.value));
                });
    return true;
  }

  if (strcmp(command, "calibrate_min") == 0) {
    uint16_t raw = 0;
    return calibrate_min(raw, fault);
  }

  if (strcmp(command, "calibrate_max") == 0) {
    uint16_t raw = 0;
    return calibrate_max(raw, fault);
  }

  if (strcmp(command, "set_stroke_length") == 0) {
    float mm = 0;
    if (!step_params::get_float(params, "length_mm", mm, fault)) return false;
    return set_stroke_length(mm, fault);
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "PositionSensor_SDAT_MHS_M160 has no command '%s'", command);
}
