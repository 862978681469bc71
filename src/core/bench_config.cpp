#include "core/bench_config.h"

#include <ArduinoJson.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "components/al2205_hub.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/port_map.h"

namespace {
constexpr const char* TAG = "bench";
constexpr const char* GENERAL_ALIAS = "General";

bool parse_hub_label(const char* label, int& channel) {
  if (!label || label[0] != 'X' || label[1] != '1' || label[2] != '.') return false;
  char* end = nullptr;
  const long value = strtol(label + 3, &end, 10);
  if (end == label + 3 || *end != '\0' || value < 0 || value > 7) return false;
  channel = static_cast<int>(value);
  return true;
}

std::string value_as_text(JsonVariantConst value) {
  if (value.is<const char*>()) return value.as<const char*>();
  std::string text;
  serializeJson(value, text);
  return text;
}

void read_names(JsonObjectConst names, std::map<std::string, std::string>& out) {
  for (JsonPairConst entry : names) {
    if (entry.value().is<JsonObjectConst>()) {
      // launcher nests names per address space: {"al1342": {...}, "al2205": {...}}
      read_names(entry.value().as<JsonObjectConst>(), out);
      continue;
    }
    const char* alias = entry.value().as<const char*>();
    if (alias && *alias) out[entry.key().c_str()] = alias;
  }
}

std::string default_alias(const std::string& module) {
  std::string alias = module;
  for (char& c : alias) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
  return alias;
}

std::string pick_alias(const BenchConfig& config, const std::string& label, const std::string& module,
                       const DeviceSet& devices) {
  auto named = config.device_names.find(label);
  if (named != config.device_names.end()) return named->second;

  const std::string base = default_alias(module);
  std::string alias = base;
  for (int n = 2; devices.contains(alias); ++n) alias = base + "_" + std::to_string(n);
  return alias;
}

const ParamMap* options_for(const BenchConfig& config, const std::string& alias) {
  auto it = config.device_options.find(alias);
  return it == config.device_options.end() ? nullptr : &it->second;
}

bool build_one(const BenchConfig& config, const std::string& label, const std::string& module,
               DeviceAttach expected_attach, DeviceBuildContext& ctx, DeviceSet& devices, IDevice** built,
               Fault* fault) {
  const DeviceTypeInfo* type = device_registry::find(module.c_str());
  if (!type) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_module", "%s: unknown module '%s'",
                       label.c_str(), module.c_str());
  }
  if (type->attach != expected_attach) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "wrong_slot", "%s: '%s' cannot be attached here",
                       label.c_str(), module.c_str());
  }

  const std::string alias = pick_alias(config, label, module, devices);
  ctx.options = options_for(config, alias);
  std::unique_ptr<IDevice> device = type->factory(ctx, fault);
  if (!device) return false;

  IDevice* raw = device.get();
  if (!devices.add(alias, std::move(device), fault)) return false;
  if (built) *built = raw;
  LOGI(TAG, "%s: %s as '%s'", label.c_str(), module.c_str(), alias.c_str());
  return true;
}
} // namespace

std::string gateway_slot_label(int port) {
  char buf[8];
  snprintf(buf, sizeof(buf), "X%02d", port);
  return buf;
}

std::string hub_slot_label(int channel) {
  return "X1." + std::to_string(channel);
}

bool parse_bench_config(const std::string& json, BenchConfig& out, Fault* fault) {
  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, json);
  if (err) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "config_parse", "bench config: %s", err.c_str());
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "config_parse", "bench config must be an object");
  }

  out = BenchConfig{};
  out.ip_address = root["ip_address"] | "";

  for (JsonPairConst entry : root["al1342"].as<JsonObjectConst>()) {
    int port = 0;
    if (!port_map::parse_port_label(entry.key().c_str(), port)) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_port", "al1342: bad port label '%s'",
                         entry.key().c_str());
    }
    const char* module = entry.value() | EMPTY_SLOT;
    if (std::string(module) != EMPTY_SLOT && *module) out.gateway_ports[port] = module;
  }

  for (JsonPairConst entry : root["al2205"].as<JsonObjectConst>()) {
    int channel = 0;
    if (!parse_hub_label(entry.key().c_str(), channel)) {
      return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_index", "al2205: bad channel label '%s'",
                         entry.key().c_str());
    }
    const char* module = entry.value() | EMPTY_SLOT;
    if (std::string(module) != EMPTY_SLOT && *module) out.hub_channels[channel] = module;
  }

  read_names(root["device_names"].as<JsonObjectConst>(), out.device_names);

  for (JsonPairConst entry : root["device_options"].as<JsonObjectConst>()) {
    ParamMap& options = out.device_options[entry.key().c_str()];
    for (JsonPairConst option : entry.value().as<JsonObjectConst>()) {
      options[option.key().c_str()] = value_as_text(option.value());
    }
  }
  return true;
}

bool load_bench_config(const std::string& path, BenchConfig& out, Fault* fault) {
  std::ifstream in(path);
  if (!in) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "config_missing", "cannot open bench config %s",
                       path.c_str());
  }
  std::stringstream text;
  text << in.rdbuf();
  return parse_bench_config(text.str(), out, fault);
}

bool build_devices(const BenchConfig& config, IRegisterBus* bus, CalibrationStore* calibration,
                   DeadlineScheduler* scheduler, DeviceSet& devices, Fault* fault) {
  DeviceBuildContext ctx;
  ctx.bus = bus;
  ctx.calibration = calibration;
  ctx.scheduler = scheduler;

  Al2205Hub* hub = nullptr;
  for (const auto& slot : config.gateway_ports) {
    ctx.port = slot.first;
    ctx.channel = -1;
    IDevice* built = nullptr;
    if (!build_one(config, gateway_slot_label(slot.first), slot.second, DeviceAttach::GATEWAY_PORT, ctx, devices,
                   &built, fault)) {
      return false;
    }
    if (&built->type() == &device_types::AL2205_HUB) {
      if (hub) {
        LOGW(TAG, "more than one AL2205 hub, analog channels use the one on X%02d", hub->port());
      } else {
        hub = static_cast<Al2205Hub*>(built);
      }
    }
  }

  for (const auto& slot : config.hub_channels) {
    ctx.port = hub ? hub->port() : 0;
    ctx.channel = slot.first;
    ctx.hub = hub;
    if (!build_one(config, hub_slot_label(slot.first), slot.second, DeviceAttach::HUB_CHANNEL, ctx, devices,
                   nullptr, fault)) {
      return false;
    }
  }

  if (!devices.contains(GENERAL_ALIAS)) {
    ctx.port = 0;
    ctx.channel = -1;
    ctx.options = nullptr;
    if (!devices.add(GENERAL_ALIAS, device_types::GENERAL.factory(ctx, fault), fault)) return false;
  }
  return true;
}
