#include "core/script_engine.h"

#include <chrono>
#include <cstdlib>
#include <system_error>

#include "core/clock.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "engine";

std::vector<std::string> param_names(const CommandInfo& info) {
  std::vector<std::string> names;
  if (!info.params) return names;
  for (const std::string& name : step_params::split_list(info.params)) {
    names.push_back(!name.empty() && name.back() == '?' ? name.substr(0, name.size() - 1) : name);
  }
  return names;
}
} // namespace

ScriptEngine::ScriptEngine(DeviceSet& devices, EventChannel& events) : devices_(devices), events_(events) {}

ScriptEngine::~ScriptEngine() {
  const char* err = nullptr;
  if (run_.active() && !run_.handle_command(RunCommand::STOP, "shutdown", &err)) {
    LOGW(TAG, "stop on shutdown rejected: %s", err);
  }
  cancel_ = true;
  cancel_background(true);
  wake();
  if (worker_.joinable()) worker_.join();
  join_background();
}

bool ScriptEngine::bind_step(const DeviceSet& devices, const ScriptStep& step, CompiledLine& line, Fault* fault) {
  IDevice* device = devices.find(step.device);
  if (!device) {
    return raise_fault(fault, FaultKind::SCRIPT, "unknown_device", "%s: no device named '%s'",
                       step.describe().c_str(), step.device.c_str());
  }
  const CommandInfo* command = device_registry::find_command(device->type(), step.command.c_str());
  if (!command) {
    return raise_fault(fault, FaultKind::SCRIPT, "unknown_command", "%s: %s has no command '%s'",
                       step.describe().c_str(), device->type().type_id, step.command.c_str());
  }

  const std::vector<std::string> names = param_names(*command);
  ParamMap params;
  for (const auto& param : step.params) {
    if (param.first[0] != '#') {
      bool known = false;
      for (const std::string& name : names) known = known || name == param.first;
      if (!known) {
        return raise_fault(fault, FaultKind::SCRIPT, "unknown_param", "%s: unknown parameter '%s'",
                           step.describe().c_str(), param.first.c_str());
      }
      params[param.first] = param.second;
    }
  }
  // Positional arguments fill parameters in order; extras extend the last one as a list.
  for (const auto& param : step.params) {
    if (param.first[0] != '#') continue;
    const size_t index = static_cast<size_t>(atoi(param.first.c_str() + 1));
    if (names.empty()) {
      return raise_fault(fault, FaultKind::SCRIPT, "too_many_args", "%s takes no arguments",
                         step.describe().c_str());
    }
    const std::string& name = index < names.size() ? names[index] : names.back();
    auto it = params.find(name);
    if (it == params.end()) {
      params[name] = param.second;
    } else if (index >= names.size()) {
      it->second += ", " + param.second;
    } else {
      return raise_fault(fault, FaultKind::SCRIPT, "duplicate_param", "%s: '%s' given twice",
                         step.describe().c_str(), name.c_str());
    }
  }

  if (!step_params::check_required(*command, params, fault)) return false;

  line = CompiledLine{};
  line.alias = step.device;
  line.device = device;
  line.command = command;
  line.params = std::move(params);
  line.background = step.background;
  line.hold_s = step.hold_s;
  line.text = step.describe();
  return true;
}

bool ScriptEngine::start(const ScriptProgram& program, const char** err, Fault* fault) {
  if (err) *err = nullptr;
  if (program.name.empty()) {
    if (err) *err = "missing_name";
    return false;
  }
  if (program.iterations < 1) {
    if (err) *err = "bad_iterations";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!worker_done_) {
      if (err) *err = "worker_busy";
      return false;
    }
  }
  if (run_.active() || run_.state() == RunState::STOPPING) {
    if (err) *err = "already_active";
    return false;
  }

  std::vector<CompiledLine> setup;
  std::vector<CompiledLine> lines;
  for (const ScriptStep& step : program.compile_setup()) {
    CompiledLine line;
    if (!bind_step(devices_, step, line, fault)) {
      if (err) *err = "invalid_step";
      return false;
    }
    setup.push_back(std::move(line));
  }
  for (const ScriptStep& step : program.compile()) {
    CompiledLine line;
    if (!bind_step(devices_, step, line, fault)) {
      if (err) *err = "invalid_step";
      return false;
    }
    lines.push_back(std::move(line));
  }

  if (worker_.joinable()) worker_.join();
  join_background();

  if (run_.state() == RunState::STOPPED && !run_.handle_command(RunCommand::RESET, nullptr, err)) return false;
  if (!run_.handle_command(RunCommand::START, nullptr, err)) return false;

  test_name_ = program.name;
  iterations_ = program.iterations;
  setup_ = std::move(setup);
  lines_ = std::move(lines);
  cancel_ = false;
  lines_executed_ = 0;
  iteration_ = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker_done_ = false;
    step_tokens_ = 0;
    last_fault_.clear();
  }

  LOGI(TAG, "starting '%s': %zu setup line(s), %zu line(s) x %d iteration(s)", test_name_.c_str(),
       setup_.size(), lines_.size(), iterations_);
  worker_ = std::thread([this] { worker(); });
  return true;
}

bool ScriptEngine::pause(const char** err) {
  if (!run_.handle_command(RunCommand::PAUSE, nullptr, err)) return false;
  wake();
  return true;
}

bool ScriptEngine::resume(const char** err) {
  if (!run_.handle_command(RunCommand::RESUME, nullptr, err)) return false;
  if (run_.take_connection_lost()) {
    Fault fault;
    if (!devices_.reapply_outputs(&fault)) {
      LOGW(TAG, "setpoints not restored after reconnect: %s", fault.detail.c_str());
    }
  }
  wake();
  return true;
}

bool ScriptEngine::step(const char** err) {
  if (err) *err = nullptr;
  if (!run_.status().step_mode) {
    if (err) *err = "not_step_mode";
    return false;
  }
  if (!run_.active()) {
    if (err) *err = "not_running";
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++step_tokens_;
  }
  gate_cv_.notify_all();
  return true;
}

void ScriptEngine::set_step_mode(bool enabled) {
  run_.set_step_mode(enabled);
  LOGI(TAG, "step mode %s", enabled ? "on" : "off");
  wake();
}

bool ScriptEngine::stop(uint32_t timeout_ms, const char** err) {
  if (!run_.handle_command(RunCommand::STOP, nullptr, err)) return false;
  cancel_ = true;
  cancel_background(true);
  wake();

  if (!wait_finished(timeout_ms)) {
    LOGW(TAG, "worker still finishing its current line after %u ms", timeout_ms);
    return false;
  }
  if (worker_.joinable()) worker_.join();
  join_background();
  return true;
}

bool ScriptEngine::reset(const char** err) {
  if (run_.state() == RunState::STOPPING || run_.active()) {
    if (err) *err = "active";
    return false;
  }
  if (worker_.joinable()) worker_.join();
  join_background();
  return run_.handle_command(RunCommand::RESET, nullptr, err);
}

void ScriptEngine::on_link_lost() {
  if (run_.connection_lost()) {
    events_.post("connection lost, run paused");
    wake();
  }
}

bool ScriptEngine::wait_finished(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  return done_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return worker_done_; });
}

Fault ScriptEngine::last_fault() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_fault_;
}

void ScriptEngine::wake() {
  { std::lock_guard<std::mutex> lock(mutex_); }
  gate_cv_.notify_all();
}

bool ScriptEngine::wait_gate() {
  std::unique_lock<std::mutex> lock(mutex_);
  gate_cv_.wait(lock, [this] {
    if (cancel_.load()) return true;
    const RunStatus st = run_.status();
    if (st.state != RunState::RUNNING) return false;
    return !st.step_mode || step_tokens_ > 0;
  });
  if (cancel_.load()) return false;
  if (run_.status().step_mode && step_tokens_ > 0) --step_tokens_;
  return true;
}

bool ScriptEngine::start_background(const CompiledLine& line, Fault* fault) {
  float duration_s = 0;
  bool has_duration = false;
  Fault bad_duration;
  if (!step_params::get_optional_float(line.params, "duration", duration_s, has_duration, &bad_duration)) {
    LOGD(TAG, "%s: %s, runs until cancelled", line.text.c_str(), bad_duration.detail.c_str());
    has_duration = false;
  }

  BackgroundTask task;
  task.cancel = std::make_shared<std::atomic<bool>>(false);
  task.done = std::make_shared<std::atomic<bool>>(false);
  task.bounded = has_duration && duration_s > 0;

  std::lock_guard<std::mutex> lock(background_mutex_);
  try {
    task.thread = std::thread([this, line, cancel = task.cancel, done = task.done] {
      StepContext ctx{line.alias.c_str(), &events_, cancel.get()};
      Fault local;
      if (!line.device->execute(line.command->name, line.params, ctx, &local)) {
        LOGE(TAG, "background %s failed: %s", line.text.c_str(), local.detail.c_str());
      }
      done->store(true);
    });
  } catch (const std::system_error& e) {
    return raise_fault(fault, FaultKind::SCRIPT, "background_failed", "%s: cannot start background task: %s",
                       line.text.c_str(), e.what());
  }
  // stop() sets cancel_ before it walks background_; a task added after that walk sees it here.
  if (cancel_.load()) task.cancel->store(true);
  background_.push_back(std::move(task));
  return true;
}

bool ScriptEngine::run_line(const CompiledLine& line, Fault* fault) {
  if (line.background) {
    LOGI(TAG, "%s (background)", line.text.c_str());
    if (!start_background(line, fault)) return false;
  } else {
    LOGI(TAG, "%s", line.text.c_str());
    StepContext ctx{line.alias.c_str(), &events_, &cancel_};
    Fault local;
    if (!line.device->execute(line.command->name, line.params, ctx, &local)) {
      return raise_fault(fault, FaultKind::SCRIPT, local.reason, "%s failed (%s): %s", line.text.c_str(),
                         to_str(local.kind), local.detail.c_str());
    }
  }

  if (line.hold_s > 0) {
    LOGD(TAG, "hold %.2f s", static_cast<double>(line.hold_s));
    delay_ms_cancellable(static_cast<uint32_t>(line.hold_s * 1000.0f), &cancel_);
  }
  return true;
}

void ScriptEngine::cancel_background(bool include_bounded) {
  std::lock_guard<std::mutex> lock(background_mutex_);
  for (BackgroundTask& task : background_) {
    if (include_bounded || !task.bounded) task.cancel->store(true);
  }
}

void ScriptEngine::reap_background() {
  std::vector<BackgroundTask> finished;
  {
    std::lock_guard<std::mutex> lock(background_mutex_);
    for (auto it = background_.begin(); it != background_.end();) {
      if (it->done->load()) {
        finished.push_back(std::move(*it));
        it = background_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (BackgroundTask& task : finished) {
    if (task.thread.joinable()) task.thread.join();
  }
}

void ScriptEngine::join_background() {
  std::vector<BackgroundTask> tasks;
  {
    std::lock_guard<std::mutex> lock(background_mutex_);
    tasks.swap(background_);
  }
  for (BackgroundTask& task : tasks) {
    if (task.thread.joinable()) task.thread.join();
  }
}

size_t ScriptEngine::background_tasks() const {
  std::lock_guard<std::mutex> lock(background_mutex_);
  return background_.size();
}

void ScriptEngine::worker() {
  Fault fault;
  bool failed = false;

  for (const CompiledLine& line : setup_) {
    if (!wait_gate()) break;
    if (!run_line(line, &fault)) {
      failed = true;
      break;
    }
    lines_executed_++;
  }

  for (int i = 1; i <= iterations_ && !failed && !cancel_.load(); ++i) {
    iteration_ = i;
    reap_background();
    Fault reapply;
    if (!devices_.reapply_outputs(&reapply)) {
      LOGW(TAG, "iteration %d: re-applying setpoints failed: %s", i, reapply.detail.c_str());
    }
    LOGI(TAG, "iteration %d/%d", i, iterations_);

    for (const CompiledLine& line : lines_) {
      if (!wait_gate()) break;
      if (!run_line(line, &fault)) {
        failed = true;
        break;
      }
      lines_executed_++;
    }
  }

  if (failed) {
    LOGE(TAG, "%s", fault.detail.c_str());
    events_.post("error: " + fault.detail);
  }
  const char* stop_reason = failed ? "script_error" : (cancel_.load() ? nullptr : "completed");
  const char* err = nullptr;
  if (!run_.handle_command(RunCommand::STOP, stop_reason, &err)) {
    LOGW(TAG, "stop rejected: %s", err);
  }

  // Background monitors without a duration run until cancelled.
  cancel_background(failed || cancel_.load());
  join_background();

  if (!run_.handle_command(RunCommand::FINISH, nullptr, &err)) {
    LOGW(TAG, "finish rejected: %s", err);
  }
  LOGI(TAG, "'%s' finished after %zu line(s)", test_name_.c_str(), lines_executed_.load());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed) last_fault_ = fault;
    worker_done_ = true;
  }
  done_cv_.notify_all();
}
