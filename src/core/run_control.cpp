#include "core/run_control.h"

#include "core/log.h"

namespace {
const char* operator_reason(RunCommand cmd) {
  switch (cmd) {
    case RunCommand::START: return "operator_start";
    case RunCommand::PAUSE: return "operator_pause";
    case RunCommand::RESUME: return "operator_resume";
    case RunCommand::STOP: return "operator_stop";
    case RunCommand::FINISH: return "finished";
    case RunCommand::RESET: return "idle";
    default: return "operator";
  }
}
} // namespace

bool RunControl::handle_command(RunCommand cmd, const char* reason, const char** err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (err) {
    *err = nullptr;
  }

  const RunState from = status_.state;
  RunState to = from;
  switch (cmd) {
    case RunCommand::START:
      if (from != RunState::IDLE && from != RunState::STOPPED) {
        if (err) *err = "already_active";
        return false;
      }
      to = RunState::RUNNING;
      status_.connection_lost = false;
      break;
    case RunCommand::PAUSE:
      if (from == RunState::PAUSED) return true;
      if (from != RunState::RUNNING) {
        if (err) *err = "not_running";
        return false;
      }
      to = RunState::PAUSED;
      break;
    case RunCommand::RESUME:
      if (from != RunState::PAUSED) {
        if (err) *err = "not_paused";
        return false;
      }
      to = RunState::RUNNING;
      break;
    case RunCommand::STOP:
      if (from == RunState::STOPPING || from == RunState::STOPPED) return true;
      if (from != RunState::RUNNING && from != RunState::PAUSED) {
        if (err) *err = "not_active";
        return false;
      }
      to = RunState::STOPPING;
      break;
    case RunCommand::FINISH:
      if (from == RunState::IDLE) {
        if (err) *err = "not_active";
        return false;
      }
      to = RunState::STOPPED;
      break;
    case RunCommand::RESET:
      if (from == RunState::IDLE) return true;
      if (from != RunState::STOPPED) {
        if (err) *err = "active";
        return false;
      }
      to = RunState::IDLE;
      status_.connection_lost = false;
      break;
  }

  status_.state = to;
  // FINISH keeps the stop reason so callers can tell an error stop from a completed run.
  if (cmd != RunCommand::FINISH || from != RunState::STOPPING) {
    status_.reason = reason ? reason : operator_reason(cmd);
  }
  LOGI("run", "%s -> %s (%s)", to_str(from), to_str(to), status_.reason);
  return true;
}

bool RunControl::connection_lost() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_.state != RunState::RUNNING) return false;
  status_.state = RunState::PAUSED;
  status_.reason = "connection_lost";
  status_.connection_lost = true;
  LOGW("run", "RUNNING -> PAUSED (connection_lost)");
  return true;
}

bool RunControl::take_connection_lost() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool was_lost = status_.connection_lost;
  status_.connection_lost = false;
  return was_lost;
}

void RunControl::set_step_mode(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_.step_mode = enabled;
}

RunStatus RunControl::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

RunState RunControl::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_.state;
}

bool RunControl::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_.state == RunState::RUNNING || status_.state == RunState::PAUSED;
}
