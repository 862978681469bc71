#pragma once

#include <stdint.h>

#include <mutex>

enum class RunState : uint8_t {
  IDLE = 0,
  RUNNING = 1,
  PAUSED = 2,
  STOPPING = 3,
  STOPPED = 4
};

enum class RunCommand : uint8_t {
  START = 0,
  PAUSE = 1,
  RESUME = 2,
  STOP = 3,
  FINISH = 4,  // worker has exited
  RESET = 5
};

struct RunStatus {
  RunState state {RunState::IDLE};
  const char* reason {"idle"};
  bool connection_lost {false};
  bool step_mode {false};
};

inline const char* to_str(RunState state) {
  switch (state) {
    case RunState::IDLE: return "IDLE";
    case RunState::RUNNING: return "RUNNING";
    case RunState::PAUSED: return "PAUSED";
    case RunState::STOPPING: return "STOPPING";
    case RunState::STOPPED: return "STOPPED";
    default: return "UNKNOWN";
  }
}

inline const char* to_str(RunCommand cmd) {
  switch (cmd) {
    case RunCommand::START: return "START";
    case RunCommand::PAUSE: return "PAUSE";
    case RunCommand::RESUME: return "RESUME";
    case RunCommand::STOP: return "STOP";
    case RunCommand::FINISH: return "FINISH";
    case RunCommand::RESET: return "RESET";
    default: return "UNKNOWN";
  }
}

// Execution state machine of one test run:
// IDLE -> RUNNING <-> PAUSED -> STOPPING -> STOPPED -> IDLE.
// Thread-safe; the worker and operator/monitor tasks all go through here.
class RunControl {
public:
  RunControl() = default;

  bool handle_command(RunCommand cmd, const char* reason, const char** err);

  // Auto-pause on lost connectivity. True when this call paused the run.
  bool connection_lost();
  // Clears the lost flag; returns whether it was set.
  bool take_connection_lost();

  void set_step_mode(bool enabled);

  RunStatus status() const;
  RunState state() const;
  bool active() const;  // RUNNING or PAUSED

private:
  mutable std::mutex mutex_;
  RunStatus status_ {};
};
