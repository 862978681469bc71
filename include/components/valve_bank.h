#pragma once

#include <stdint.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/deadline_scheduler.h"
#include "core/device.h"
#include "core/register_bus.h"

// SMC SY3000 valve manifold: 16 solenoids (1.A..8.B) behind one output word on an
// AL1342 port. X.A and X.B drive the same actuator and are never on together.
class ValveBank : public IDevice {
public:
  ValveBank(IRegisterBus& bus, int port, uint16_t write_register, DeadlineScheduler& scheduler);
  ~ValveBank() override;

  static bool valve_mask(const std::string& valve, uint16_t& mask);
  static std::string paired_valve(const std::string& valve);

  // On until turned off.
  bool valve_on(const std::string& valve, Fault* fault);
  // On, then off again after duration_s (0 switches off at once). Negative is rejected.
  bool valve_on(const std::string& valve, float duration_s, Fault* fault);
  bool valve_off(const std::vector<std::string>& valves, Fault* fault);
  bool all_off(Fault* fault);

  std::set<std::string> active_valves() const;
  uint16_t output_word() const;
  size_t pending_timers() const;

  const DeviceTypeInfo& type() const override;
  bool execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) override;
  bool log_value(std::string& out) override;

private:
  static uint16_t compute_word(const std::set<std::string>& valves);
  bool switch_on(const std::string& valve_in, bool timed, float duration_s, Fault* fault);
  // Writes the word for `valves`; active_ and last_word_ change only if the write succeeds.
  bool commit_locked(std::set<std::string> valves, Fault* fault);
  void cancel_timer_locked(const std::string& valve);
  void on_auto_off(const std::string& valve, const std::shared_ptr<DeadlineScheduler::TimerId>& timer);

  IRegisterBus& bus_;
  int port_;
  uint16_t write_register_;
  DeadlineScheduler& scheduler_;

  mutable std::mutex mutex_;
  std::set<std::string> active_;
  std::map<std::string, DeadlineScheduler::TimerId> timers_;
  uint16_t last_word_ {0};
};
