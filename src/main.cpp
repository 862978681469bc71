#include <poll.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include <ArduinoJson.h>

#include "app/app_config.h"
#include "core/bench_config.h"
#include "core/bench_session.h"
#include "core/calibration_store.h"
#include "core/clock.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/modbus_link.h"
#include "core/script_program.h"

// -------------------------------------------------------------------------------------------------
// Command line
// -------------------------------------------------------------------------------------------------
struct CliOptions {
  std::string config_path;
  std::string script_path;
  std::string host;
  std::string log_dir;
  bool step_mode {false};
  bool list_commands {false};
};

static void print_usage(const char* argv0)
{
  fprintf(stderr,
          "usage: %s [--host IP] [--log-dir DIR] [--step] <bench.json> [script.json]\n"
          "       %s --list-commands\n"
          "script defaults to $MRLF_TEST_SCRIPT, log dir to $MRLF_TEST_DIR (logs)\n"
          "while running: p pause, r resume, n step, m toggle step mode, b <label> break,\n"
          "               ? status, s stop, q stop and quit\n",
          argv0, argv0);
}

static bool parse_args(int argc, char** argv, CliOptions& opts)
{
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (strcmp(arg, "--list-commands") == 0) {
      opts.list_commands = true;
    } else if (strcmp(arg, "--step") == 0) {
      opts.step_mode = true;
    } else if (strcmp(arg, "--host") == 0 && i + 1 < argc) {
      opts.host = argv[++i];
    } else if (strcmp(arg, "--log-dir") == 0 && i + 1 < argc) {
      opts.log_dir = argv[++i];
    } else if (arg[0] == '-') {
      return false;
    } else if (opts.config_path.empty()) {
      opts.config_path = arg;
    } else if (opts.script_path.empty()) {
      opts.script_path = arg;
    } else {
      return false;
    }
  }
  return opts.list_commands || !opts.config_path.empty();
}

static void list_commands()
{
  for (size_t i = 0; i < device_registry::count(); ++i) {
    const DeviceTypeInfo& type = device_registry::at(i);
    printf("%s\n", type.type_id);
    for (size_t c = 0; c < type.command_count; ++c) {
      printf("    %s\n", type.commands[c].usage);
    }
  }
}

// -------------------------------------------------------------------------------------------------
// Operator console
// -------------------------------------------------------------------------------------------------
static void print_status(ScriptEngine& engine, HealthManager& health)
{
  const RunStatus st = engine.status();
  const SystemHealth sh = health.system_health();

  JsonDocument doc;
  doc["ts_ms"] = millis_now();
  doc["test"] = engine.test_name();
  doc["state"] = to_str(st.state);
  doc["reason"] = st.reason;
  doc["iteration"] = engine.iteration();
  doc["lines"] = engine.lines_executed();
  doc["step_mode"] = st.step_mode;
  doc["connection_lost"] = st.connection_lost;
  doc["link"] = to_str(sh.system_state);
  doc["degraded"] = sh.degraded;
  JsonArray checks = doc["health"].to<JsonArray>();
  const uint32_t now = millis_now();
  for (size_t i = 0; i < health.count(); ++i) {
    const IHealthComponent* c = health.component(i);
    if (!c) continue;
    JsonObject entry = checks.add<JsonObject>();
    entry["name"] = c->name();
    entry["status"] = to_str(HealthManager::effective_status(*c, now));
    entry["reason"] = c->report().reason;
  }
  serializeJson(doc, std::cout);
  std::cout << std::endl;
}

// Returns false when the operator asked to quit.
static bool handle_console_line(const std::string& line, BenchSession& session)
{
  ScriptEngine& engine = session.engine();
  const char* err = nullptr;
  bool ok = true;

  switch (line.empty() ? '\0' : line[0]) {
    case 'p': ok = engine.pause(&err); break;
    case 'r': ok = engine.resume(&err); break;
    case 'n': ok = engine.step(&err); break;
    case 'm': engine.set_step_mode(!engine.status().step_mode); break;
    case 'b':
      if (session.logger()) session.logger()->insert_break(line.size() > 2 ? line.substr(2) : "break");
      break;
    case '?': print_status(engine, session.health()); break;
    case 's': ok = engine.stop(WORKER_JOIN_TIMEOUT_MS, &err); break;
    case 'q':
      if (!engine.stop(WORKER_JOIN_TIMEOUT_MS, &err) && err) LOGW("cli", "stop: %s", err);
      return false;
    case '\0': break;
    default: LOGW("cli", "unknown command '%s'", line.c_str()); break;
  }
  if (!ok && err) LOGW("cli", "%s rejected: %s", line.c_str(), err);
  return true;
}

static bool stdin_open = true;

static bool read_console_line(std::string& line, int timeout_ms)
{
  pollfd pfd {STDIN_FILENO, POLLIN, 0};
  if (poll(&pfd, 1, timeout_ms) <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) return false;
  if (std::getline(std::cin, line)) return true;
  stdin_open = false;  // unattended run from here on
  return false;
}

// -------------------------------------------------------------------------------------------------
// Main
// -------------------------------------------------------------------------------------------------
int main(int argc, char** argv)
{
  logging::configure_from_env();

  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage(argv[0]);
    return 2;
  }
  if (opts.list_commands) {
    list_commands();
    return 0;
  }

  if (opts.script_path.empty()) opts.script_path = script_path_from_env();
  if (opts.script_path.empty()) {
    LOGE("cli", "no script given and MRLF_TEST_SCRIPT is not set");
    return 2;
  }
  if (opts.log_dir.empty()) opts.log_dir = test_dir_from_env();

  Fault fault;
  BenchConfig config;
  if (!load_bench_config(opts.config_path, config, &fault)) {
    LOGE("cli", "%s", fault.detail.c_str());
    return 1;
  }
  ScriptProgram program;
  if (!load_script_program(opts.script_path, program, &fault)) {
    LOGE("cli", "%s", fault.detail.c_str());
    return 1;
  }

  CalibrationStore calibration(CalibrationStore::default_path());
  if (!calibration.load(&fault)) {
    LOGE("cli", "%s", fault.detail.c_str());
    return 1;
  }

  GatewayConfig gateway = GATEWAY_DEFAULTS;
  const std::string host = !opts.host.empty() ? opts.host : config.ip_address;
  if (!host.empty()) gateway.host = host.c_str();

  LOGI("cli", "[%s] gateway %s:%u", BENCH_ID, gateway.host, gateway.port);
  ModbusLink link(gateway, TRANSPORT_POLICY);
  if (!link.open(&fault)) {
    LOGE("cli", "%s", fault.detail.c_str());
    return 1;
  }
  link.prime();

  BenchSession session(link, calibration);
  if (!session.configure(config, &fault)) {
    LOGE("cli", "%s", fault.detail.c_str());
    return 1;
  }

  ScriptEngine& engine = session.engine();
  engine.set_step_mode(opts.step_mode);

  const char* err = nullptr;
  if (!session.start(program, opts.log_dir, &err, &fault)) {
    LOGE("cli", "start rejected: %s %s", err ? err : "", fault.detail.c_str());
    return 1;
  }
  session.start_link_monitor();

  bool quit = false;
  while (!quit && !engine.wait_finished(stdin_open ? 0 : 100)) {
    std::string line;
    if (!stdin_open) continue;
    if (read_console_line(line, 100)) quit = !handle_console_line(line, session);
  }
  if (!engine.wait_finished(WORKER_JOIN_TIMEOUT_MS)) {
    LOGW("cli", "worker did not finish, exiting with it still running");
  }

  std::string archived;
  if (session.finish(&archived)) {
    LOGI("cli", "log archived to %s", archived.c_str());
  } else {
    LOGW("cli", "log not archived");
  }

  const Fault last = engine.last_fault();
  print_status(engine, session.health());
  link.close();
  if (!last.ok()) LOGE("cli", "%s: %s", to_str(last.kind), last.detail.c_str());
  return last.ok() ? 0 : 1;
}
