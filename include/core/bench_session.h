#pragma once

#include <memory>
#include <string>
#include <vector>

#include "components/gateway_health.h"
#include "components/port_health.h"
#include "core/bench_config.h"
#include "core/calibration_store.h"
#include "core/csv_logger.h"
#include "core/deadline_scheduler.h"
#include "core/device_set.h"
#include "core/event_channel.h"
#include "core/health_manager.h"
#include "core/link_monitor.h"
#include "core/register_bus.h"
#include "core/script_engine.h"

// MRLF_TEST_DIR, else "logs".
std::string test_dir_from_env();

// "<dir>/<safe name>_<YYYYmmdd_HHMMSS>.csv"
std::string archive_log_path(const std::string& dir, const std::string& test_name);

// One test session: the drivers built from the bench config, the script engine, the
// csv logger and the connection monitor, sharing one register bus.
class BenchSession {
public:
  BenchSession(IRegisterBus& bus, CalibrationStore& calibration);
  ~BenchSession();

  BenchSession(const BenchSession&) = delete;
  BenchSession& operator=(const BenchSession&) = delete;

  bool configure(const BenchConfig& config, Fault* fault);

  // Watches gateway reachability and auto-pauses the run on loss.
  void start_link_monitor(uint32_t period_ms = LINK_MONITOR_PERIOD_MS);

  // Opens <log_dir>/<safe name>_running.csv and starts logging, then the script.
  bool start(const ScriptProgram& program, const std::string& log_dir, const char** err, Fault* fault,
             uint32_t logger_period_ms = LOGGER_PERIOD_MS);

  // Stops logging and renames the log to its archive name. Call once the run has ended.
  bool finish(std::string* archived_path);

  ScriptEngine& engine() { return *engine_; }
  DeviceSet& devices() { return devices_; }
  EventChannel& events() { return events_; }
  HealthManager& health() { return health_; }
  CsvLogger* logger() { return logger_.get(); }

private:
  IRegisterBus& bus_;
  CalibrationStore& calibration_;

  DeadlineScheduler scheduler_;
  EventChannel events_;
  DeviceSet devices_;
  std::unique_ptr<ScriptEngine> engine_;
  std::unique_ptr<CsvLogger> logger_;
  std::string log_dir_;

  HealthManager health_;
  GatewayHealthComponent gateway_health_;
  std::vector<std::unique_ptr<IolinkPortHealth>> port_health_;
  std::unique_ptr<LinkMonitor> monitor_;
};
