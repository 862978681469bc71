#pragma once

#include <stdint.h>

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "core/register_bus.h"

// In-memory register file standing in for the AL1342. Unset registers read as 0.
class FakeRegisterBus : public IRegisterBus {
public:
  bool read_holding(uint16_t addr, uint16_t count, uint16_t* out, Fault* fault) override {
    std::lock_guard<std::mutex> lock(mutex_);
    reads_.push_back({addr, count});
    if (!reachable_) {
      return raise_fault(fault, FaultKind::CONNECTIVITY, "read_failed", "fake bus unreachable");
    }
    for (uint16_t i = 0; i < count; ++i) {
      const uint16_t reg = static_cast<uint16_t>(addr + i);
      if (failing_.count(reg)) {
        return raise_fault(fault, FaultKind::CONNECTIVITY, "read_failed", "fake read of %u failed", reg);
      }
      auto it = regs_.find(reg);
      out[i] = it == regs_.end() ? 0 : it->second;
    }
    return true;
  }

  bool write_holding(uint16_t addr, uint16_t value, Fault* fault) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reachable_) {
      return raise_fault(fault, FaultKind::CONNECTIVITY, "write_failed", "fake bus unreachable");
    }
    regs_[addr] = value;
    writes_.push_back({addr, value});
    return true;
  }

  bool probe(Fault* fault) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reachable_) {
      return raise_fault(fault, FaultKind::CONNECTIVITY, "probe_failed", "fake bus unreachable");
    }
    return true;
  }

  void set(uint16_t addr, uint16_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    regs_[addr] = value;
  }
  void fail_reads_of(uint16_t addr) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(addr);
  }
  void set_reachable(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_ = reachable;
  }

  std::vector<std::pair<uint16_t, uint16_t>> writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }
  std::vector<uint16_t> writes_to(uint16_t addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint16_t> values;
    for (const auto& w : writes_) {
      if (w.first == addr) values.push_back(w.second);
    }
    return values;
  }
  // Reads whose range covers addr.
  size_t reads_of(uint16_t addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& r : reads_) {
      if (addr >= r.first && addr < r.first + r.second) n++;
    }
    return n;
  }
  void clear_log() {
    std::lock_guard<std::mutex> lock(mutex_);
    reads_.clear();
    writes_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::map<uint16_t, uint16_t> regs_;
  std::set<uint16_t> failing_;
  std::vector<std::pair<uint16_t, uint16_t>> reads_;  // addr, count
  std::vector<std::pair<uint16_t, uint16_t>> writes_; // addr, value
  bool reachable_ {true};
};
