#pragma once

// Linear mapping of an electrical input range onto a physical range:
// out = out_min + (in - in_min) / (in_max - in_min) * (out_max - out_min)
struct AnalogSpan {
  float in_min;
  float in_max;
  float out_min;
  float out_max;

  float map(float in) const {
    const float normalized = (in - in_min) / (in_max - in_min);
    return out_min + normalized * (out_max - out_min);
  }
};

// Hub channels report millivolts / microamps as raw counts.
static constexpr float ANALOG_RAW_DIVISOR = 1000.0f;

// 4-20 mA loop onto [min, max].
inline AnalogSpan current_loop_span(float min, float max) {
  return AnalogSpan{4.0f, 20.0f, min, max};
}
