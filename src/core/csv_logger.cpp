#include "core/csv_logger.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

#include "core/log.h"

namespace {
constexpr const char* TAG = "csv";
constexpr const char* NO_VALUE = "-";
} // namespace

CsvLogger::CsvLogger(std::vector<LogColumn> columns, EventChannel& events, uint32_t period_ms)
  : columns_(std::move(columns)), events_(events), period_ms_(period_ms) {}

CsvLogger::~CsvLogger() {
  {
    std::lock_guard<std::mutex> lock(task_mutex_);
    stop_requested_ = true;
  }
  task_cv_.notify_all();
  if (task_.joinable()) task_.join();
}

std::string CsvLogger::timestamp_now() {
  using namespace std::chrono;
  const system_clock::time_point now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const long ms = static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
  std::tm tm_local {};
  localtime_r(&secs, &tm_local);
  char buf[32];
  const size_t n = strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_local);
  snprintf(buf + n, sizeof(buf) - n, ".%03ld", ms);
  return buf;
}

std::string CsvLogger::csv_field(const std::string& value) {
  if (value.find_first_of(",\"\n") == std::string::npos) return value;
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string CsvLogger::safe_file_name(const std::string& name) {
  std::string out;
  for (char c : name) {
    const unsigned char uc = static_cast<unsigned char>(c);
    out += (isalnum(uc) || c == '-' || c == '_') ? c : '_';
  }
  return out.empty() ? "test" : out;
}

bool CsvLogger::open(const std::string& path, Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path(), ec);

  file_.open(path, std::ios::out | std::ios::trunc);
  if (!file_) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "log_open", "cannot open log file %s", path.c_str());
  }
  path_ = path;
  rows_ = 0;

  std::string header = "timestamp";
  for (const LogColumn& column : columns_) header += "," + csv_field(column.alias);
  header += ",event";
  if (!write_line_locked(header)) {
    file_.close();
    return raise_fault(fault, FaultKind::CONFIGURATION, "log_open", "cannot write header to %s", path.c_str());
  }
  LOGI(TAG, "logging %zu column(s) to %s", columns_.size(), path.c_str());
  return true;
}

bool CsvLogger::start(Fault* fault) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "log_not_open", "open() the log before start()");
    }
  }
  std::lock_guard<std::mutex> lock(task_mutex_);
  if (!task_done_) return true;
  if (task_.joinable()) task_.join();
  stop_requested_ = false;
  task_done_ = false;
  task_ = std::thread([this] { run(); });
  return true;
}

bool CsvLogger::stop(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(task_mutex_);
  stop_requested_ = true;
  task_cv_.notify_all();
  if (!task_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return task_done_; })) {
    LOGW(TAG, "sampling task did not stop within %u ms", timeout_ms);
    return false;
  }
  lock.unlock();
  if (task_.joinable()) task_.join();

  std::lock_guard<std::mutex> file_lock(mutex_);
  if (file_.is_open()) {
    file_.close();
    LOGI(TAG, "closed %s after %zu row(s)", path_.c_str(), rows_);
  }
  return true;
}

bool CsvLogger::running() const {
  std::lock_guard<std::mutex> lock(task_mutex_);
  return !task_done_;
}

size_t CsvLogger::rows_written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rows_;
}

bool CsvLogger::write_line_locked(const std::string& line) {
  if (!file_.is_open()) return false;
  file_ << line << '\n';
  file_.flush();
  return static_cast<bool>(file_);
}

bool CsvLogger::write_row() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) return false;

  std::string line = timestamp_now();
  for (const LogColumn& column : columns_) {
    std::string value;
    line += ',';
    line += column.device && column.device->log_value(value) ? csv_field(value) : NO_VALUE;
  }
  std::string event;
  line += ',';
  line += events_.take(event) ? csv_field(event) : NO_VALUE;

  if (!write_line_locked(line)) {
    LOGE(TAG, "write to %s failed", path_.c_str());
    return false;
  }
  ++rows_;
  return true;
}

void CsvLogger::insert_break(const std::string& label) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string line = timestamp_now();
  for (size_t i = 0; i < columns_.size(); ++i) line += ",";
  line += "," + csv_field("--- " + label + " ---");
  if (!write_line_locked(line)) {
    LOGW(TAG, "break '%s' not written", label.c_str());
    return;
  }
  ++rows_;
}

void CsvLogger::run() {
  std::unique_lock<std::mutex> lock(task_mutex_);
  while (!stop_requested_) {
    lock.unlock();
    write_row();
    lock.lock();
    task_cv_.wait_for(lock, std::chrono::milliseconds(period_ms_), [this] { return stop_requested_; });
  }
  // Last row so the final state (and any pending event) is on record.
  lock.unlock();
  write_row();
  lock.lock();
  task_done_ = true;
  task_cv_.notify_all();
}
