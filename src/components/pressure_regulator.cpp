#include "components/pressure_regulator.h"

#include <strings.h>

#include <cmath>
#include <cstdio>
#include <cstring>

#include "app/app_config.h"
#include "core/clock.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "regulator";
} // namespace

RegulatorCurve::RegulatorCurve(float min_psi, float max_psi, uint16_t output_max)
  : min_psi_(min_psi), max_psi_(max_psi), output_max_(output_max) {}

float RegulatorCurve::clamp(float psi) const {
  if (psi < min_psi_) return min_psi_;
  if (psi > max_psi_) return max_psi_;
  return psi;
}

uint16_t RegulatorCurve::raw_for(float psi) const {
  const float raw = (clamp(psi) - min_psi_) / (max_psi_ - min_psi_) * output_max_;
  if (raw <= 0.0f) return 0;
  if (raw >= output_max_) return output_max_;
  return static_cast<uint16_t>(raw);
}

float RegulatorCurve::psi_for(uint16_t raw) const {
  return raw / static_cast<float>(output_max_) * (max_psi_ - min_psi_) + min_psi_;
}

bool parse_regulator_options(const ParamMap* options, RegulatorOptions& out, Fault* fault) {
  if (!options) return true;
  if (step_params::has(*options, "min_psi") && !step_params::get_float(*options, "min_psi", out.min_psi, fault)) {
    return false;
  }
  if (step_params::has(*options, "max_psi") && !step_params::get_float(*options, "max_psi", out.max_psi, fault)) {
    return false;
  }
  if (step_params::has(*options, "output_max")) {
    int ceiling = 0;
    if (!step_params::get_int(*options, "output_max", ceiling, fault)) return false;
    if (ceiling <= 0 || ceiling > 65535) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_output_max",
                         "output_max must be 1..65535 (got %d)", ceiling);
    }
    out.output_max = static_cast<uint16_t>(ceiling);
  }
  if (step_params::has(*options, "mode")) {
    std::string mode;
    if (!step_params::get_string(*options, "mode", mode, fault)) return false;
    if (strcasecmp(mode.c_str(), "settle") == 0) {
      out.mode = RegulatorMode::SETTLE;
    } else if (strcasecmp(mode.c_str(), "fire_and_forget") == 0) {
      out.mode = RegulatorMode::FIRE_AND_FORGET;
    } else {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_mode",
                         "regulator mode must be fire_and_forget or settle (got '%s')", mode.c_str());
    }
  }
  if (step_params::has(*options, "settle_tolerance_psi")) {
    if (!step_params::get_float(*options, "settle_tolerance_psi", out.settle_tolerance_psi, fault)) return false;
    if (!(out.settle_tolerance_psi > 0.0f)) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_tolerance", "settle_tolerance_psi must be > 0");
    }
  }
  if (step_params::has(*options, "settle_timeout_s")) {
    float timeout_s = 0;
    if (!step_params::get_float(*options, "settle_timeout_s", timeout_s, fault)) return false;
    if (!(timeout_s > 0.0f) || timeout_s > 600.0f) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_timeout",
                         "settle_timeout_s must be above 0 and at most 600");
    }
    out.settle_timeout_ms = static_cast<uint32_t>(timeout_s * 1000.0f);
  }
  if (!(out.max_psi > out.min_psi)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_range", "max_psi must exceed min_psi");
  }
  return true;
}

PressureRegulator::PressureRegulator(IRegisterBus& bus, int port, uint16_t command_register,
                                     uint16_t feedback_register, const RegulatorOptions& options)
  : bus_(bus), port_(port), command_register_(command_register), feedback_register_(feedback_register),
    curve_(options.min_psi, options.max_psi, options.output_max), mode_(options.mode),
    settle_tolerance_psi_(options.settle_tolerance_psi), settle_timeout_ms_(options.settle_timeout_ms) {}

bool PressureRegulator::write_command(float psi, Fault* fault) {
  const uint16_t raw = curve_.raw_for(psi);
  if (!bus_.write_holding(command_register_, raw, fault)) return false;
  LOGI(TAG, "X0%d set %.2f psi (raw %u)", port_, static_cast<double>(curve_.clamp(psi)), raw);
  return true;
}

bool PressureRegulator::set_pressure(float target_psi, Fault* fault, const std::atomic<bool>* cancel) {
  if (!write_command(target_psi, fault)) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    setpoint_ = curve_.clamp(target_psi);
    has_setpoint_ = true;
  }
  if (mode_ == RegulatorMode::SETTLE) {
    const bool reached = wait_for_settle(curve_.clamp(target_psi), cancel);
    std::lock_guard<std::mutex> lock(mutex_);
    settled_ = reached;
  }
  return true;
}

bool PressureRegulator::settled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settled_;
}

bool PressureRegulator::wait_for_settle(float target_psi, const std::atomic<bool>* cancel) {
  const uint32_t start = millis_now();
  while (millis_now() - start < settle_timeout_ms_) {
    if (cancel && cancel->load()) return false;
    float psi = 0;
    uint16_t raw = 0;
    Fault fault;
    if (read_feedback_psi(psi, raw, &fault)) {
      const float error = std::fabs(psi - target_psi);
      LOGD(TAG, "X0%d feedback %.2f psi (raw %u) error %.2f", port_, static_cast<double>(psi), raw,
           static_cast<double>(error));
      if (error <= settle_tolerance_psi_) {
        LOGI(TAG, "X0%d within tolerance at %.2f psi", port_, static_cast<double>(psi));
        return true;
      }
    } else {
      LOGW(TAG, "X0%d feedback read failed: %s", port_, fault.detail.c_str());
    }
    if (!delay_ms_cancellable(REGULATOR_SETTLE_POLL_MS, cancel)) return false;
  }
  LOGW(TAG, "X0%d did not reach %.2f psi within %u ms", port_, static_cast<double>(target_psi),
       settle_timeout_ms_);
  return false;
}

bool PressureRegulator::read_feedback_psi(float& psi, uint16_t& raw, Fault* fault) {
  if (!read_register(bus_, feedback_register_, raw, fault)) return false;
  psi = curve_.psi_for(raw);
  return true;
}

bool PressureRegulator::has_setpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_setpoint_;
}

float PressureRegulator::setpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return setpoint_;
}

bool PressureRegulator::reapply_outputs(Fault* fault) {
  float psi = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_setpoint_) return true;
    psi = setpoint_;
  }
  LOGI(TAG, "X0%d re-applying %.2f psi", port_, static_cast<double>(psi));
  return write_command(psi, fault);
}

bool PressureRegulator::log_value(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_setpoint_) return false;
  char buf[24];
  snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(setpoint_));
  out = buf;
  return true;
}

const DeviceTypeInfo& PressureRegulator::type() const {
  return device_types::PRESSURE_REGULATOR_ITV1050;
}

bool PressureRegulator::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "set_pressure") == 0) {
    float target = 0;
    if (!step_params::get_float(params, "target_psi", target, fault)) return false;
    return set_pressure(target, fault, ctx.cancel);
  }

  if (strcmp(command, "read_pressure") == 0) {
    float psi = 0;
    uint16_t raw = 0;
    if (!read_feedback_psi(psi, raw, fault)) return false;
    LOGI(TAG, "%s feedback %.2f psi (raw %u)", ctx.alias, static_cast<double>(psi), raw);
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "PressureRegulator_ITV_1050 has no command '%s'", command);
}
