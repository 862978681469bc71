#include "core/calibration_store.h"

#include <ArduinoJson.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/log.h"

namespace {
constexpr const char* TAG = "calib";
constexpr const char* DEFAULT_PATH = "config/sensor_calibrations.json";
} // namespace

CalibrationStore::CalibrationStore(std::string path) : path_(std::move(path)) {}

std::string CalibrationStore::default_path() {
  const char* env = std::getenv("MRLF_CALIBRATION_FILE");
  if (env && *env) return env;
  return DEFAULT_PATH;
}

bool CalibrationStore::load(Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  if (path_.empty()) return true;

  std::ifstream in(path_);
  if (!in) {
    LOGI(TAG, "no calibration file at %s, starting empty", path_.c_str());
    return true;
  }
  std::stringstream text;
  text << in.rdbuf();

  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, text.str());
  if (err) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "calibration_parse",
                       "%s: %s", path_.c_str(), err.c_str());
  }

  for (JsonPair entry : doc.as<JsonObject>()) {
    JsonObject values = entry.value().as<JsonObject>();
    if (values.isNull()) continue;
    CalibrationRecord rec;
    if (values["min"].is<float>()) {
      rec.has_min = true;
      rec.min = values["min"].as<float>();
    }
    if (values["max"].is<float>()) {
      rec.has_max = true;
      rec.max = values["max"].as<float>();
    }
    if (values["stroke"].is<float>()) {
      rec.has_stroke = true;
      rec.stroke = values["stroke"].as<float>();
    }
    records_[entry.key().c_str()] = rec;
  }
  LOGI(TAG, "loaded %zu calibration entries from %s", records_.size(), path_.c_str());
  return true;
}

CalibrationRecord CalibrationStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(key);
  return it == records_.end() ? CalibrationRecord{} : it->second;
}

bool CalibrationStore::set_value(const std::string& key, const char* field, float value, Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  CalibrationRecord& rec = records_[key];
  if (strcmp(field, "min") == 0) {
    rec.has_min = true;
    rec.min = value;
  } else if (strcmp(field, "max") == 0) {
    rec.has_max = true;
    rec.max = value;
  } else if (strcmp(field, "stroke") == 0) {
    rec.has_stroke = true;
    rec.stroke = value;
  } else {
    return raise_fault(fault, FaultKind::CONFIGURATION, "bad_field", "unknown calibration field '%s'", field);
  }
  return save_locked(fault);
}

bool CalibrationStore::save_locked(Fault* fault) const {
  if (path_.empty()) return true;

  JsonDocument doc;
  for (const auto& entry : records_) {
    JsonObject values = doc[entry.first].to<JsonObject>();
    if (entry.second.has_min) values["min"] = entry.second.min;
    if (entry.second.has_max) values["max"] = entry.second.max;
    if (entry.second.has_stroke) values["stroke"] = entry.second.stroke;
  }

  const std::filesystem::path target(path_);
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "calibration_write",
                       "cannot write calibration file %s", path_.c_str());
  }
  serializeJsonPretty(doc, out);
  return true;
}
