#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/device.h"

// Live driver instances keyed by alias, in configuration order.
class DeviceSet {
public:
  DeviceSet() = default;
  ~DeviceSet() { clear(); }

  DeviceSet(const DeviceSet&) = delete;
  DeviceSet& operator=(const DeviceSet&) = delete;

  bool add(const std::string& alias, std::unique_ptr<IDevice> device, Fault* fault);

  IDevice* find(const std::string& alias) const;
  bool contains(const std::string& alias) const { return find(alias) != nullptr; }

  std::vector<std::string> aliases() const;
  size_t size() const { return devices_.size(); }
  IDevice* at(size_t index) const { return devices_[index].second.get(); }
  const std::string& alias_at(size_t index) const { return devices_[index].first; }

  // Every device gets its turn; the first failure is reported.
  bool reapply_outputs(Fault* fault);

  void clear();

private:
  std::vector<std::pair<std::string, std::unique_ptr<IDevice>>> devices_;
};
