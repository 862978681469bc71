#pragma once

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/device.h"
#include "core/device_set.h"
#include "core/event_channel.h"
#include "core/run_control.h"
#include "core/script_program.h"

// A script step bound to a live driver and command descriptor.
struct CompiledLine {
  std::string alias;
  IDevice* device {nullptr};
  const CommandInfo* command {nullptr};
  ParamMap params;
  bool background {false};
  float hold_s {0};
  std::string text;
};

// Runs a ScriptProgram against a DeviceSet on one worker thread: setup once, then the
// compiled lines for N iterations. Pause, step and stop are checked between lines only;
// a line in flight always completes (holds and monitors end early on stop).
//
// Background lines run on their own thread beside the main line. When the run completes,
// background tasks with a duration run to their own end and the others are cancelled;
// stop() cancels all of them.
class ScriptEngine {
public:
  ScriptEngine(DeviceSet& devices, EventChannel& events);
  ~ScriptEngine();

  ScriptEngine(const ScriptEngine&) = delete;
  ScriptEngine& operator=(const ScriptEngine&) = delete;

  // Binds positional arguments to parameter names and checks required ones.
  static bool bind_step(const DeviceSet& devices, const ScriptStep& step, CompiledLine& line, Fault* fault);

  bool start(const ScriptProgram& program, const char** err, Fault* fault = nullptr);
  bool pause(const char** err);
  bool resume(const char** err);
  bool step(const char** err);
  void set_step_mode(bool enabled);

  // Requests a stop and waits up to timeout_ms for the worker. False if it is still
  // finishing a line; reset() or the destructor joins it later.
  bool stop(uint32_t timeout_ms, const char** err);
  bool reset(const char** err);

  // Called by the connection monitor.
  void on_link_lost();

  // Waits until the worker has exited. False on timeout.
  bool wait_finished(uint32_t timeout_ms);

  RunStatus status() const { return run_.status(); }
  Fault last_fault() const;
  size_t lines_executed() const { return lines_executed_.load(); }
  int iteration() const { return iteration_.load(); }
  const std::string& test_name() const { return test_name_; }
  // Background tasks started and not yet joined.
  size_t background_tasks() const;

private:
  void worker();
  bool wait_gate();
  bool run_line(const CompiledLine& line, Fault* fault);
  struct BackgroundTask {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> cancel;
    std::shared_ptr<std::atomic<bool>> done;
    bool bounded {false};  // ends by itself after its duration
  };

  bool start_background(const CompiledLine& line, Fault* fault);
  void cancel_background(bool include_bounded);
  // Joins tasks that have already returned.
  void reap_background();
  void join_background();
  void wake();

  DeviceSet& devices_;
  EventChannel& events_;
  RunControl run_;

  std::string test_name_;
  int iterations_ {1};
  std::vector<CompiledLine> setup_;
  std::vector<CompiledLine> lines_;

  mutable std::mutex mutex_;
  std::condition_variable gate_cv_;
  std::condition_variable done_cv_;
  size_t step_tokens_ {0};
  bool worker_done_ {true};
  Fault last_fault_;

  std::atomic<bool> cancel_ {false};
  std::atomic<size_t> lines_executed_ {0};
  std::atomic<int> iteration_ {0};

  std::thread worker_;
  mutable std::mutex background_mutex_;
  std::vector<BackgroundTask> background_;
};
