#pragma once

#include <map>
#include <mutex>
#include <string>

#include "core/fault.h"

struct CalibrationRecord {
  bool has_min {false};
  bool has_max {false};
  bool has_stroke {false};
  float min {0};
  float max {0};
  float stroke {0};
};

// Keyed calibration values ("X1.2" -> {min, max, stroke}) persisted as JSON. The file
// format belongs to the configuration layer; drivers only get/set single values.
class CalibrationStore {
public:
  // An empty path keeps the store in memory only.
  explicit CalibrationStore(std::string path);

  // MRLF_CALIBRATION_FILE, else config/sensor_calibrations.json.
  static std::string default_path();

  // A missing file is an empty store, not an error.
  bool load(Fault* fault);

  CalibrationRecord get(const std::string& key) const;

  // field is "min", "max" or "stroke". Persists immediately when a path is set.
  bool set_value(const std::string& key, const char* field, float value, Fault* fault);

  const std::string& path() const { return path_; }

private:
  bool save_locked(Fault* fault) const;

  std::string path_;
  mutable std::mutex mutex_;
  std::map<std::string, CalibrationRecord> records_;
};
