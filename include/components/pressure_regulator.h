#pragma once

#include <stdint.h>

#include <atomic>
#include <mutex>

#include "app/app_config.h"
#include "core/device.h"
#include "core/register_bus.h"

// Linear map from pressure to raw command counts, clamped to [min_psi, max_psi].
class RegulatorCurve {
public:
  RegulatorCurve(float min_psi, float max_psi, uint16_t output_max);

  uint16_t raw_for(float psi) const;
  float psi_for(uint16_t raw) const;
  float clamp(float psi) const;

  float min_psi() const { return min_psi_; }
  float max_psi() const { return max_psi_; }
  uint16_t output_max() const { return output_max_; }

private:
  float min_psi_;
  float max_psi_;
  uint16_t output_max_;
};

enum class RegulatorMode : uint8_t { FIRE_AND_FORGET = 0, SETTLE = 1 };

struct RegulatorOptions {
  float min_psi {15.0f};
  float max_psi {115.0f};
  uint16_t output_max {65535};
  RegulatorMode mode {RegulatorMode::FIRE_AND_FORGET};
  float settle_tolerance_psi {REGULATOR_SETTLE_TOLERANCE_PSI};
  uint32_t settle_timeout_ms {REGULATOR_SETTLE_TIMEOUT_MS};
};

bool parse_regulator_options(const ParamMap* options, RegulatorOptions& out, Fault* fault);

// SMC ITV1050 electro-pneumatic regulator. Command goes to the port's write base,
// feedback comes back on the port's read base.
class PressureRegulator : public IDevice {
public:
  PressureRegulator(IRegisterBus& bus, int port, uint16_t command_register, uint16_t feedback_register,
                    const RegulatorOptions& options);

  // Clamps, converts and writes once. In SETTLE mode also waits for feedback; a timeout
  // is logged and the command still counts as issued.
  bool set_pressure(float target_psi, Fault* fault, const std::atomic<bool>* cancel = nullptr);
  // Outcome of the last SETTLE wait.
  bool settled() const;
  bool read_feedback_psi(float& psi, uint16_t& raw, Fault* fault);

  bool has_setpoint() const;
  float setpoint() const;
  const RegulatorCurve& curve() const { return curve_; }

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override;
  bool reapply_outputs(Fault* fault) override;

private:
  bool write_command(float psi, Fault* fault);
  bool wait_for_settle(float target_psi, const std::atomic<bool>* cancel);

  IRegisterBus& bus_;
  int port_;
  uint16_t command_register_;
  uint16_t feedback_register_;
  RegulatorCurve curve_;
  RegulatorMode mode_;
  float settle_tolerance_psi_;
  uint32_t settle_timeout_ms_;

  mutable std::mutex mutex_;
  bool has_setpoint_ {false};
  float setpoint_ {0};
  bool settled_ {false};
};
