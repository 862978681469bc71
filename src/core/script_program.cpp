#include "core/script_program.h"

#include <ArduinoJson.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "core/step_params.h"

namespace {

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

// Splits on commas outside quotes.
bool split_args(const std::string& text, std::vector<std::string>& out, Fault* fault) {
  std::string current;
  char quote = 0;
  for (char c : text) {
    if (quote) {
      current += c;
      if (c == quote) quote = 0;
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      current += c;
      continue;
    }
    if (c == ',') {
      out.push_back(trim(current));
      current.clear();
      continue;
    }
    current += c;
  }
  if (quote) {
    return raise_fault(fault, FaultKind::SCRIPT, "unterminated_quote", "unterminated quote in '%s'", text.c_str());
  }
  const std::string last = trim(current);
  if (!last.empty() || !out.empty()) out.push_back(last);
  return true;
}

std::string value_as_text(JsonVariantConst value) {
  if (value.isNull()) return "None";
  if (value.is<const char*>()) return value.as<const char*>();
  std::string text;
  serializeJson(value, text);
  return text;
}

bool parse_step(JsonVariantConst node, ScriptStep& step, Fault* fault) {
  if (node.is<const char*>()) return parse_step_line(node.as<const char*>(), step, fault);

  JsonObjectConst obj = node.as<JsonObjectConst>();
  if (obj.isNull()) {
    return raise_fault(fault, FaultKind::SCRIPT, "bad_step", "step must be a string or an object");
  }
  step = ScriptStep{};
  step.device = obj["device"] | "";
  step.command = obj["command"] | "";
  step.background = obj["background"] | false;
  step.hold_s = obj["hold_s"] | 0.0f;
  for (JsonPairConst param : obj["params"].as<JsonObjectConst>()) {
    step.params[param.key().c_str()] = value_as_text(param.value());
  }
  if (step.hold_s < 0) {
    return raise_fault(fault, FaultKind::SCRIPT, "bad_step", "%s: hold_s must be >= 0", step.describe().c_str());
  }
  return true;
}

bool parse_steps(JsonArrayConst nodes, std::vector<ScriptStep>& out, Fault* fault) {
  for (JsonVariantConst node : nodes) {
    ScriptStep step;
    if (!parse_step(node, step, fault)) return false;
    out.push_back(std::move(step));
  }
  return true;
}

std::vector<ScriptStep> non_blank(const std::vector<ScriptStep>& steps) {
  std::vector<ScriptStep> out;
  for (const ScriptStep& step : steps) {
    if (!step.blank()) out.push_back(step);
  }
  return out;
}

} // namespace

std::string ScriptStep::describe() const {
  std::string text = device + "." + command + "(";
  bool first = true;
  for (const auto& param : params) {
    if (!first) text += ", ";
    first = false;
    if (param.first[0] != '#') text += param.first + "=";
    text += param.second;
  }
  text += ")";
  return text;
}

std::vector<ScriptStep> ScriptProgram::compile() const {
  std::vector<ScriptStep> lines;
  for (const ScriptSection& section : sections) {
    for (ScriptStep& step : non_blank(section.steps)) lines.push_back(std::move(step));
  }
  return lines;
}

std::vector<ScriptStep> ScriptProgram::compile_setup() const {
  return non_blank(setup);
}

bool parse_step_line(const std::string& text, ScriptStep& step, Fault* fault) {
  step = ScriptStep{};
  const std::string line = trim(text);
  if (line.empty() || line[0] == '#') return true;

  const size_t open = line.find('(');
  const size_t close = line.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close < open || close != line.size() - 1) {
    return raise_fault(fault, FaultKind::SCRIPT, "bad_step_line", "expected alias.command(...) in '%s'",
                       line.c_str());
  }

  const std::string target = trim(line.substr(0, open));
  const size_t dot = target.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == target.size()) {
    return raise_fault(fault, FaultKind::SCRIPT, "bad_step_line", "expected alias.command in '%s'",
                       target.c_str());
  }
  step.device = target.substr(0, dot);
  step.command = target.substr(dot + 1);

  std::vector<std::string> args;
  if (!split_args(line.substr(open + 1, close - open - 1), args, fault)) return false;

  int positional = 0;
  for (const std::string& arg : args) {
    if (arg.empty()) {
      return raise_fault(fault, FaultKind::SCRIPT, "bad_step_line", "empty argument in '%s'", line.c_str());
    }
    const size_t eq = arg.find('=');
    const bool quoted = arg[0] == '"' || arg[0] == '\'';
    if (eq != std::string::npos && !quoted) {
      step.params[trim(arg.substr(0, eq))] = trim(arg.substr(eq + 1));
    } else {
      step.params["#" + std::to_string(positional++)] = arg;
    }
  }
  return true;
}

bool parse_script_program(const std::string& json, ScriptProgram& out, Fault* fault) {
  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, json);
  if (err) {
    return raise_fault(fault, FaultKind::SCRIPT, "script_parse", "script: %s", err.c_str());
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    return raise_fault(fault, FaultKind::SCRIPT, "script_parse", "script must be an object");
  }

  out = ScriptProgram{};
  out.name = root["name"] | "";
  out.iterations = root["iterations"] | 1;
  if (!parse_steps(root["setup"].as<JsonArrayConst>(), out.setup, fault)) return false;

  for (JsonVariantConst entry : root["sections"].as<JsonArrayConst>()) {
    JsonObjectConst node = entry.as<JsonObjectConst>();
    ScriptSection section;
    section.name = node["name"] | "";
    if (!parse_steps(node["steps"].as<JsonArrayConst>(), section.steps, fault)) return false;
    out.sections.push_back(std::move(section));
  }
  return true;
}

bool load_script_program(const std::string& path, ScriptProgram& out, Fault* fault) {
  std::ifstream in(path);
  if (!in) {
    return raise_fault(fault, FaultKind::SCRIPT, "script_missing", "cannot open script %s", path.c_str());
  }
  std::stringstream text;
  text << in.rdbuf();
  return parse_script_program(text.str(), out, fault);
}

std::string script_path_from_env() {
  const char* env = std::getenv("MRLF_TEST_SCRIPT");
  return env ? env : "";
}
