#pragma once

#include <stdint.h>

#include <string>

#include "components/al2205_hub.h"
#include "core/calibration_store.h"
#include "core/device.h"

// SDAT-MHS-M160 linear position sensor on an AL2205 channel. Raw counts are mapped
// onto [0, stroke] through a captured min/max calibration kept in the calibration store
// under "X1.<channel>".
class PositionSensor : public IDevice {
public:
  static constexpr float DEFAULT_STROKE_MM = 150.0f;

  PositionSensor(Al2205Hub& hub, int channel, CalibrationStore& store);

  bool calibrate_min(uint16_t& raw, Fault* fault);
  bool calibrate_max(uint16_t& raw, Fault* fault);
  bool set_stroke_length(float mm, Fault* fault);
  float stroke_length() const { return stroke_mm_; }

  bool read_position(float& mm, Fault* fault);

  // Clamped to [0, stroke] and rounded to 0.01 mm.
  static bool position_from_raw(uint16_t raw, const CalibrationRecord& cal, float stroke_mm,
                                float& mm, Fault* fault);

  const std::string& calibration_key() const { return key_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override { return reported_.take(out); }

private:
  bool capture(const char* field, uint16_t& raw, Fault* fault);

  Al2205Hub& hub_;
  int channel_;
  CalibrationStore& store_;
  std::string key_;
  float stroke_mm_ {DEFAULT_STROKE_MM};
  ReportedValue reported_;
};
