#pragma once

#include <stdint.h>

#include <mutex>
#include <string>

#include <modbus.h>

#include "config/bench_al1342.h"
#include "core/register_bus.h"

// Modbus TCP connection to the AL1342 gateway. Reads retry with linear backoff and
// reopen the socket between attempts; writes are issued once.
class ModbusLink : public IRegisterBus {
public:
  ModbusLink(const GatewayConfig& gateway, const TransportPolicy& policy);
  ~ModbusLink() override;

  ModbusLink(const ModbusLink&) = delete;
  ModbusLink& operator=(const ModbusLink&) = delete;

  bool open(Fault* fault);
  void close();
  bool is_open() const;

  bool read_holding(uint16_t addr, uint16_t count, uint16_t* out, Fault* fault) override;
  bool write_holding(uint16_t addr, uint16_t value, Fault* fault) override;
  bool probe(Fault* fault) override;

  // Throwaway read to warm up the link. Never fails.
  void prime();

  const std::string& host() const { return host_; }
  uint16_t port() const { return gateway_.port; }

private:
  bool ensure_open_locked(uint8_t attempts, Fault* fault);
  bool connect_locked();
  void close_locked();
  bool read_locked(uint16_t addr, uint16_t count, uint16_t* out, uint8_t retries, Fault* fault);

  std::string host_;
  GatewayConfig gateway_;
  TransportPolicy policy_;
  mutable std::mutex mutex_;
  modbus_t* ctx_ {nullptr};
  bool connected_ {false};
};
