#pragma once

#include <map>
#include <string>

#include "core/device.h"
#include "core/device_set.h"

class CalibrationStore;
class DeadlineScheduler;
class IRegisterBus;

// Test-cell description written by the launcher: which module sits on which AL1342
// port and AL2205 channel, plus optional per-slot aliases and per-alias options.
struct BenchConfig {
  std::string ip_address;
  std::map<int, std::string> gateway_ports;          // 1..8 -> module type id
  std::map<int, std::string> hub_channels;           // 0..7 -> module type id
  std::map<std::string, std::string> device_names;   // "X01" / "X1.3" -> alias
  std::map<std::string, ParamMap> device_options;    // alias -> options
};

static constexpr const char* EMPTY_SLOT = "Empty";

bool parse_bench_config(const std::string& json, BenchConfig& out, Fault* fault);
bool load_bench_config(const std::string& path, BenchConfig& out, Fault* fault);

std::string gateway_slot_label(int port);   // "X03"
std::string hub_slot_label(int channel);    // "X1.3"

// Instantiates every configured slot (gateway ports first, then hub channels) and the
// "General" pseudo-device. Fails on the first unknown module or misplaced device.
bool build_devices(const BenchConfig& config, IRegisterBus* bus, CalibrationStore* calibration,
                   DeadlineScheduler* scheduler, DeviceSet& devices, Fault* fault);
