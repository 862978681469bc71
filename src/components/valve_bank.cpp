#include "components/valve_bank.h"

#include <cctype>
#include <cstring>

#include "core/device_registry.h"
#include "core/log.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "valves";

struct ValveBit {
  const char* id;
  uint16_t mask;
};

constexpr ValveBit VALVE_BITS[] = {
  {"1.A", 0x0100}, {"1.B", 0x0200},
  {"2.A", 0x0400}, {"2.B", 0x0800},
  {"3.A", 0x1000}, {"3.B", 0x2000},
  {"4.A", 0x4000}, {"4.B", 0x8000},
  {"5.A", 0x0001}, {"5.B", 0x0002},
  {"6.A", 0x0004}, {"6.B", 0x0008},
  {"7.A", 0x0010}, {"7.B", 0x0020},
  {"8.A", 0x0040}, {"8.B", 0x0080},
};

std::string normalize(const std::string& valve) {
  std::string out = step_params::clean(valve);
  for (char& c : out) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
  return out;
}
} // namespace

ValveBank::ValveBank(IRegisterBus& bus, int port, uint16_t write_register, DeadlineScheduler& scheduler)
  : bus_(bus), port_(port), write_register_(write_register), scheduler_(scheduler) {}

ValveBank::~ValveBank() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& timer : timers_) scheduler_.cancel(timer.second);
  timers_.clear();
}

bool ValveBank::valve_mask(const std::string& valve, uint16_t& mask) {
  for (const ValveBit& bit : VALVE_BITS) {
    if (valve == bit.id) {
      mask = bit.mask;
      return true;
    }
  }
  return false;
}

std::string ValveBank::paired_valve(const std::string& valve) {
  uint16_t mask = 0;
  if (!valve_mask(valve, mask)) return "";
  std::string pair = valve;
  pair.back() = valve.back() == 'A' ? 'B' : 'A';
  return pair;
}

uint16_t ValveBank::compute_word(const std::set<std::string>& valves) {
  uint16_t word = 0;
  for (const std::string& valve : valves) {
    uint16_t mask = 0;
    if (valve_mask(valve, mask)) word |= mask;
  }
  return word;
}

bool ValveBank::commit_locked(std::set<std::string> valves, Fault* fault) {
  const uint16_t word = compute_word(valves);
  if (!bus_.write_holding(write_register_, word, fault)) {
    LOGE(TAG, "X0%d write 0x%04X failed", port_, word);
    return false;
  }
  active_.swap(valves);
  last_word_ = word;
  return true;
}

void ValveBank::cancel_timer_locked(const std::string& valve) {
  auto it = timers_.find(valve);
  if (it == timers_.end()) return;
  scheduler_.cancel(it->second);
  timers_.erase(it);
}

bool ValveBank::valve_on(const std::string& valve, Fault* fault) {
  return switch_on(valve, false, 0.0f, fault);
}

bool ValveBank::valve_on(const std::string& valve, float duration_s, Fault* fault) {
  return switch_on(valve, true, duration_s, fault);
}

bool ValveBank::switch_on(const std::string& valve_in, bool timed, float duration_s, Fault* fault) {
  const std::string valve = normalize(valve_in);
  uint16_t mask = 0;
  if (!valve_mask(valve, mask)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_valve", "invalid valve name: %s",
                       valve_in.c_str());
  }
  if (timed && !(duration_s >= 0.0f)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_duration", "valve %s duration %.2f s",
                       valve.c_str(), static_cast<double>(duration_s));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string pair = paired_valve(valve);
  std::set<std::string> next = active_;
  const bool pair_was_on = next.erase(pair) > 0;
  next.insert(valve);
  if (!commit_locked(std::move(next), fault)) return false;

  if (pair_was_on) {
    cancel_timer_locked(pair);
    LOGI(TAG, "valve %s OFF (paired with %s)", pair.c_str(), valve.c_str());
  }
  cancel_timer_locked(valve);

  if (timed) {
    const uint32_t delay = static_cast<uint32_t>(duration_s * 1000.0f);
    // The slot is filled under mutex_ and read under mutex_; a firing for a replaced
    // timer no longer matches timers_ and is ignored.
    auto id_slot = std::make_shared<DeadlineScheduler::TimerId>(0);
    const DeadlineScheduler::TimerId id =
      scheduler_.schedule_after(delay, [this, valve, id_slot] { on_auto_off(valve, id_slot); });
    *id_slot = id;
    if (id != 0) timers_[valve] = id;
    LOGI(TAG, "valve %s ON for %.2f s", valve.c_str(), static_cast<double>(duration_s));
  } else {
    LOGI(TAG, "valve %s ON", valve.c_str());
  }
  return true;
}

void ValveBank::on_auto_off(const std::string& valve,
                            const std::shared_ptr<DeadlineScheduler::TimerId>& timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timers_.find(valve);
  if (it == timers_.end() || it->second != *timer) return;
  timers_.erase(it);
  std::set<std::string> next = active_;
  next.erase(valve);
  Fault fault;
  if (!commit_locked(std::move(next), &fault)) {
    LOGE(TAG, "valve %s auto-off write failed, still on: %s", valve.c_str(), fault.detail.c_str());
    return;
  }
  LOGI(TAG, "valve %s OFF (auto)", valve.c_str());
}

bool ValveBank::valve_off(const std::vector<std::string>& valves_in, Fault* fault) {
  std::vector<std::string> valves;
  for (const std::string& raw : valves_in) {
    const std::string valve = normalize(raw);
    uint16_t mask = 0;
    if (!valve_mask(valve, mask)) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_valve", "invalid valve name: %s",
                         raw.c_str());
    }
    valves.push_back(valve);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> next = active_;
  std::vector<std::string> switched;
  for (const std::string& valve : valves) {
    if (next.erase(valve) > 0) {
      switched.push_back(valve);
    } else {
      LOGW(TAG, "valve %s was not active", valve.c_str());
    }
  }
  if (!commit_locked(std::move(next), fault)) return false;
  for (const std::string& valve : switched) {
    cancel_timer_locked(valve);
    LOGI(TAG, "valve %s OFF", valve.c_str());
  }
  return true;
}

bool ValveBank::all_off(Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!commit_locked({}, fault)) return false;
  for (const auto& timer : timers_) scheduler_.cancel(timer.second);
  timers_.clear();
  LOGI(TAG, "all valves OFF");
  return true;
}

std::set<std::string> ValveBank::active_valves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

uint16_t ValveBank::output_word() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_word_;
}

size_t ValveBank::pending_timers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

bool ValveBank::log_value(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_.empty()) return false;
  out.clear();
  for (const std::string& valve : active_) {
    if (!out.empty()) out += ',';
    out += valve;
  }
  return true;
}

const DeviceTypeInfo& ValveBank::type() const {
  return device_types::VALVE_BANK_SY3000;
}

bool ValveBank::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  (void)ctx;
  if (strcmp(command, "valve_on") == 0) {
    std::string valve;
    if (!step_params::get_string(params, "valve", valve, fault)) return false;
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;
    return has_duration ? valve_on(valve, duration_s, fault) : valve_on(valve, fault);
  }

  if (strcmp(command, "valve_off") == 0) {
    std::string list;
    if (!step_params::get_string(params, "valves", list, fault)) return false;
    return valve_off(step_params::split_list(list), fault);
  }

  if (strcmp(command, "all_off") == 0) return all_off(fault);

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "ValveBank_SY3000 has no command '%s'", command);
}
