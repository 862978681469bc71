#include "core/bench_session.h"

#include <cstdlib>
#include <ctime>
#include <filesystem>

#include "core/device_registry.h"
#include "core/health_registry.h"
#include "core/log.h"
#include "core/port_map.h"

namespace {
constexpr const char* TAG = "session";
constexpr const char* DEFAULT_TEST_DIR = "logs";
} // namespace

std::string test_dir_from_env() {
  const char* env = std::getenv("MRLF_TEST_DIR");
  return (env && *env) ? env : DEFAULT_TEST_DIR;
}

std::string archive_log_path(const std::string& dir, const std::string& test_name) {
  const std::time_t now = std::time(nullptr);
  std::tm tm_local {};
  localtime_r(&now, &tm_local);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_local);
  return (std::filesystem::path(dir) / (CsvLogger::safe_file_name(test_name) + "_" + stamp + ".csv")).string();
}

BenchSession::BenchSession(IRegisterBus& bus, CalibrationStore& calibration)
  : bus_(bus), calibration_(calibration), gateway_health_(bus) {}

BenchSession::~BenchSession() {
  if (monitor_ && !monitor_->stop(WORKER_JOIN_TIMEOUT_MS)) {
    LOGW(TAG, "link monitor still running at shutdown");
  }
  const char* err = nullptr;
  if (engine_ && engine_->status().state != RunState::IDLE && engine_->status().state != RunState::STOPPED &&
      !engine_->stop(WORKER_JOIN_TIMEOUT_MS, &err)) {
    LOGW(TAG, "script worker still finishing at shutdown");
  }
  if (logger_ && !logger_->stop(LOGGER_JOIN_TIMEOUT_MS)) {
    LOGW(TAG, "logger still running at shutdown");
  }
  engine_.reset();
  // No auto-off may fire into a driver that is being destroyed.
  scheduler_.stop();
  devices_.clear();
}

bool BenchSession::configure(const BenchConfig& config, Fault* fault) {
  if (engine_ && engine_->status().state != RunState::IDLE && engine_->status().state != RunState::STOPPED) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "session_active", "cannot reconfigure during a run");
  }
  engine_.reset();
  // An auto-off already taken off the queue must finish before its driver goes away.
  scheduler_.clear();
  devices_.clear();
  if (!build_devices(config, &bus_, &calibration_, &scheduler_, devices_, fault)) return false;
  engine_ = std::make_unique<ScriptEngine>(devices_, events_);

  health_.clear();
  port_health_.clear();
  HealthRegistry registry(health_);
  if (!registry.register_component(gateway_health_, true, true)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "health_table_full", "cannot register gateway health");
  }
  for (const auto& slot : config.gateway_ports) {
    const DeviceTypeInfo* type = device_registry::find(slot.second.c_str());
    if (!type || !device_registry::uses_process_data(*type)) continue;
    uint16_t status_register = 0;
    if (!port_map::status_register(slot.first, status_register, fault)) return false;
    port_health_.push_back(std::make_unique<IolinkPortHealth>(bus_, slot.first, status_register));
    if (!registry.register_component(*port_health_.back(), true, false)) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "health_table_full", "cannot register %s health",
                         port_health_.back()->name());
    }
  }
  LOGI(TAG, "%zu device(s) configured, %zu health check(s)", devices_.size(), health_.count());
  return true;
}

void BenchSession::start_link_monitor(uint32_t period_ms) {
  if (monitor_) return;
  monitor_ = std::make_unique<LinkMonitor>(
    health_, period_ms,
    [this] {
      if (engine_) engine_->on_link_lost();
    },
    [this] { events_.post("connection restored"); });
  monitor_->start();
}

bool BenchSession::start(const ScriptProgram& program, const std::string& log_dir, const char** err, Fault* fault,
                         uint32_t logger_period_ms) {
  if (!engine_) {
    if (err) *err = "not_configured";
    return false;
  }
  if (logger_ && logger_->running()) {
    if (err) *err = "logger_busy";
    return false;
  }

  std::vector<LogColumn> columns;
  for (size_t i = 0; i < devices_.size(); ++i) {
    const DeviceTypeInfo& type = devices_.at(i)->type();
    if (&type == &device_types::GENERAL || &type == &device_types::AL2205_HUB) continue;
    columns.push_back(LogColumn{devices_.alias_at(i), devices_.at(i)});
  }

  log_dir_ = log_dir;
  logger_ = std::make_unique<CsvLogger>(std::move(columns), events_, logger_period_ms);
  const std::string live_path =
    (std::filesystem::path(log_dir) / (CsvLogger::safe_file_name(program.name) + "_running.csv")).string();
  if (!logger_->open(live_path, fault) || !logger_->start(fault)) {
    if (err) *err = "log_open";
    return false;
  }

  if (!engine_->start(program, err, fault)) {
    if (!logger_->stop(LOGGER_JOIN_TIMEOUT_MS)) LOGW(TAG, "logger did not stop");
    return false;
  }
  return true;
}

bool BenchSession::finish(std::string* archived_path) {
  if (!logger_) return false;
  if (!logger_->stop(LOGGER_JOIN_TIMEOUT_MS)) return false;

  const std::string name = engine_ ? engine_->test_name() : "test";
  const std::string target = archive_log_path(log_dir_, name);
  std::error_code ec;
  std::filesystem::rename(logger_->path(), target, ec);
  if (ec) {
    LOGE(TAG, "cannot rename %s to %s: %s", logger_->path().c_str(), target.c_str(), ec.message().c_str());
    return false;
  }
  LOGI(TAG, "log saved as %s", target.c_str());
  if (archived_path) *archived_path = target;
  return true;
}
