#include "core/step_params.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace {
bool is_none(const std::string& v) {
  return v.empty() || v == "None" || v == "none" || v == "null";
}
} // namespace

std::string step_params::clean(const std::string& raw) {
  size_t begin = 0;
  size_t end = raw.size();
  while (begin < end && isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
  while (end > begin && isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
  if (end - begin >= 2) {
    const char first = raw[begin];
    const char last = raw[end - 1];
    if ((first == '"' || first == '\'') && first == last) {
      ++begin;
      --end;
    }
  }
  return raw.substr(begin, end - begin);
}

bool step_params::has(const ParamMap& params, const char* key) {
  auto it = params.find(key);
  return it != params.end() && !is_none(clean(it->second));
}

bool step_params::get_string(const ParamMap& params, const char* key, std::string& out, Fault* fault) {
  auto it = params.find(key);
  if (it == params.end()) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "missing_param", "missing parameter '%s'", key);
  }
  out = clean(it->second);
  return true;
}

bool step_params::get_float(const ParamMap& params, const char* key, float& out, Fault* fault) {
  std::string text;
  if (!get_string(params, key, text, fault)) return false;
  char* end = nullptr;
  const float value = strtof(text.c_str(), &end);
  if (text.empty() || end == text.c_str() || *end != '\0') {
    return raise_fault(fault, FaultKind::CONFIGURATION, "bad_param",
                       "parameter '%s' is not a number: '%s'", key, text.c_str());
  }
  out = value;
  return true;
}

bool step_params::get_int(const ParamMap& params, const char* key, int& out, Fault* fault) {
  std::string text;
  if (!get_string(params, key, text, fault)) return false;
  char* end = nullptr;
  errno = 0;
  const long value = strtol(text.c_str(), &end, 10);
  if (text.empty() || end == text.c_str() || *end != '\0') {
    return raise_fault(fault, FaultKind::CONFIGURATION, "bad_param",
                       "parameter '%s' is not an integer: '%s'", key, text.c_str());
  }
  if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "bad_param",
                       "parameter '%s' is out of range: '%s'", key, text.c_str());
  }
  out = static_cast<int>(value);
  return true;
}

bool step_params::get_optional_float(const ParamMap& params, const char* key, float& out,
                                     bool& present, Fault* fault) {
  present = false;
  if (!has(params, key)) return true;
  if (!get_float(params, key, out, fault)) return false;
  present = true;
  return true;
}

std::vector<std::string> step_params::split_list(const std::string& raw) {
  std::vector<std::string> items;
  std::string current;
  for (char c : raw) {
    if (c == ',' || isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) items.push_back(clean(current));
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty()) items.push_back(clean(current));
  return items;
}

bool step_params::check_required(const CommandInfo& info, const ParamMap& params, Fault* fault) {
  if (!info.params || !*info.params) return true;

  const char* p = info.params;
  while (*p) {
    const char* comma = strchr(p, ',');
    const size_t len = comma ? static_cast<size_t>(comma - p) : strlen(p);
    std::string name(p, len);
    const bool optional = !name.empty() && name.back() == '?';
    if (optional) name.pop_back();
    if (!optional && params.find(name) == params.end()) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "missing_param",
                         "%s: missing parameter '%s'", info.name, name.c_str());
    }
    if (!comma) break;
    p = comma + 1;
  }
  return true;
}
