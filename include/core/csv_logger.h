#pragma once

#include <stddef.h>
#include <stdint.h>

#include <condition_variable>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/app_config.h"
#include "core/device.h"
#include "core/event_channel.h"

struct LogColumn {
  std::string alias;
  IDevice* device;
};

// Samples every column at a fixed period and appends one csv row per sample:
// timestamp,<alias...>,event. A column without a value this row shows "-".
class CsvLogger {
public:
  CsvLogger(std::vector<LogColumn> columns, EventChannel& events, uint32_t period_ms = LOGGER_PERIOD_MS);
  ~CsvLogger();

  CsvLogger(const CsvLogger&) = delete;
  CsvLogger& operator=(const CsvLogger&) = delete;

  // Creates parent directories, truncates and writes the header.
  bool open(const std::string& path, Fault* fault);
  bool start(Fault* fault);

  // Signals the sampling task and waits up to timeout_ms. The file is closed once the
  // task has exited.
  bool stop(uint32_t timeout_ms);

  bool write_row();
  void insert_break(const std::string& label);

  const std::string& path() const { return path_; }
  size_t rows_written() const;
  bool running() const;

  // "YYYY-MM-DD HH:MM:SS.mmm", local time.
  static std::string timestamp_now();
  static std::string csv_field(const std::string& value);
  // Letters, digits, '-' and '_' kept; everything else becomes '_'.
  static std::string safe_file_name(const std::string& name);

private:
  void run();
  bool write_line_locked(const std::string& line);

  std::vector<LogColumn> columns_;
  EventChannel& events_;
  uint32_t period_ms_;

  mutable std::mutex mutex_;  // file + counters
  std::ofstream file_;
  std::string path_;
  size_t rows_ {0};

  mutable std::mutex task_mutex_;
  std::condition_variable task_cv_;
  bool stop_requested_ {false};
  bool task_done_ {true};
  std::thread task_;
};
