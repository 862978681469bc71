#include "core/device_set.h"

#include "core/log.h"

bool DeviceSet::add(const std::string& alias, std::unique_ptr<IDevice> device, Fault* fault) {
  if (alias.empty()) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "empty_alias", "device alias may not be empty");
  }
  if (!device) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "no_device", "no driver for '%s'", alias.c_str());
  }
  if (contains(alias)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "duplicate_alias", "alias '%s' is used twice",
                       alias.c_str());
  }
  devices_.emplace_back(alias, std::move(device));
  return true;
}

IDevice* DeviceSet::find(const std::string& alias) const {
  for (const auto& entry : devices_) {
    if (entry.first == alias) return entry.second.get();
  }
  return nullptr;
}

std::vector<std::string> DeviceSet::aliases() const {
  std::vector<std::string> out;
  out.reserve(devices_.size());
  for (const auto& entry : devices_) out.push_back(entry.first);
  return out;
}

bool DeviceSet::reapply_outputs(Fault* fault) {
  bool ok = true;
  for (const auto& entry : devices_) {
    Fault local;
    if (entry.second->reapply_outputs(&local)) continue;
    LOGW("devices", "%s: re-apply failed: %s", entry.first.c_str(), local.detail.c_str());
    if (ok && fault) *fault = local;
    ok = false;
  }
  return ok;
}

void DeviceSet::clear() {
  // Reverse order: hub-attached drivers go before the hub they reference.
  while (!devices_.empty()) devices_.pop_back();
}
