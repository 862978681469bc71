#pragma once

#include <string>
#include <vector>

#include "core/device.h"

// One authored step: device alias, command, named parameters, and run options.
// Positional arguments from a step line are kept as "#0", "#1", ... until the step is
// bound to a command descriptor.
struct ScriptStep {
  std::string device;
  std::string command;
  ParamMap params;
  bool background {false};
  float hold_s {0};

  bool blank() const { return device.empty() && command.empty(); }
  std::string describe() const;
};

struct ScriptSection {
  std::string name;
  std::vector<ScriptStep> steps;
};

struct ScriptProgram {
  std::string name;
  int iterations {1};
  std::vector<ScriptStep> setup;
  std::vector<ScriptSection> sections;

  // Section steps in execution order, blank steps dropped.
  std::vector<ScriptStep> compile() const;
  std::vector<ScriptStep> compile_setup() const;
};

// Parses `alias.command(arg, key=value, ...)`. Values may be quoted; a blank line gives
// a blank step.
bool parse_step_line(const std::string& text, ScriptStep& step, Fault* fault);

// {"name", "iterations", "setup": [step...], "sections": [{"name", "steps": [step...]}]}
// where a step is either a step line string or
// {"device", "command", "params": {}, "background", "hold_s"}.
bool parse_script_program(const std::string& json, ScriptProgram& out, Fault* fault);
bool load_script_program(const std::string& path, ScriptProgram& out, Fault* fault);

// MRLF_TEST_SCRIPT, or empty when unset.
std::string script_path_from_env();
