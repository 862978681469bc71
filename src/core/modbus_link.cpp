#include "core/modbus_link.h"

#include <cerrno>

#include "core/clock.h"
#include "core/log.h"

namespace {
constexpr const char* TAG = "link";
constexpr uint8_t REOPEN_ATTEMPTS = 3;
} // namespace

ModbusLink::ModbusLink(const GatewayConfig& gateway, const TransportPolicy& policy)
  : host_(gateway.host ? gateway.host : ""), gateway_(gateway), policy_(policy) {
  gateway_.host = host_.c_str();
}

ModbusLink::~ModbusLink() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_locked();
  if (ctx_) {
    modbus_free(ctx_);
    ctx_ = nullptr;
  }
}

bool ModbusLink::open(Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_open_locked(policy_.open_attempts, fault);
}

void ModbusLink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_locked();
}

bool ModbusLink::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

bool ModbusLink::connect_locked() {
  if (!ctx_) {
    ctx_ = modbus_new_tcp(host_.c_str(), gateway_.port);
    if (!ctx_) {
      LOGE(TAG, "modbus_new_tcp(%s:%u) failed: %s", host_.c_str(), gateway_.port, modbus_strerror(errno));
      return false;
    }
    modbus_set_slave(ctx_, gateway_.unit_id);
    modbus_set_response_timeout(ctx_, gateway_.response_timeout_ms / 1000,
                                (gateway_.response_timeout_ms % 1000) * 1000);
  }

  if (modbus_connect(ctx_) == -1) {
    LOGW(TAG, "connect %s:%u failed: %s", host_.c_str(), gateway_.port, modbus_strerror(errno));
    return false;
  }
  connected_ = true;
  LOGI(TAG, "connected to %s:%u", host_.c_str(), gateway_.port);
  return true;
}

void ModbusLink::close_locked() {
  if (ctx_ && connected_) {
    modbus_close(ctx_);
  }
  connected_ = false;
}

bool ModbusLink::ensure_open_locked(uint8_t attempts, Fault* fault) {
  if (connected_) return true;

  for (uint8_t i = 0; i < attempts; ++i) {
    if (connect_locked()) return true;
    delay_ms(policy_.open_backoff_ms * (i + 1u));
  }
  return raise_fault(fault, FaultKind::CONNECTIVITY, "open_failed",
                     "unable to connect to Modbus server at %s:%u", host_.c_str(), gateway_.port);
}

bool ModbusLink::read_locked(uint16_t addr, uint16_t count, uint16_t* out, uint8_t retries,
                             Fault* fault) {
  if (!ensure_open_locked(REOPEN_ATTEMPTS, fault)) return false;

  for (uint8_t i = 0; i <= retries; ++i) {
    if (connected_) {
      const int rc = modbus_read_registers(ctx_, addr, count, out);
      if (rc == static_cast<int>(count)) return true;
      LOGW(TAG, "read %u (len %u) attempt %u failed: %s", addr, count, i + 1u, modbus_strerror(errno));
    }
    close_locked();
    delay_ms(policy_.read_backoff_ms * (i + 1u));
    if (!connect_locked()) LOGD(TAG, "reconnect before retry %u failed", i + 1u);
  }
  return raise_fault(fault, FaultKind::CONNECTIVITY, "read_failed",
                     "failed to read holding registers at %u (len %u)", addr, count);
}

bool ModbusLink::read_holding(uint16_t addr, uint16_t count, uint16_t* out, Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_locked(addr, count, out, policy_.read_retries, fault);
}

bool ModbusLink::write_holding(uint16_t addr, uint16_t value, Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_open_locked(REOPEN_ATTEMPTS, fault)) return false;

  if (modbus_write_register(ctx_, addr, value) != 1) {
    LOGW(TAG, "write %u <- 0x%04X failed: %s", addr, value, modbus_strerror(errno));
    // Drop the socket so the next call reconnects; the write itself is not repeated.
    close_locked();
    return raise_fault(fault, FaultKind::CONNECTIVITY, "write_failed",
                       "failed to write to register %u", addr);
  }
  return true;
}

bool ModbusLink::probe(Fault* fault) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_open_locked(1, fault)) return false;
  uint16_t scratch = 0;
  return read_locked(policy_.probe_register, 1, &scratch, 0, fault);
}

void ModbusLink::prime() {
  std::lock_guard<std::mutex> lock(mutex_);
  uint16_t scratch = 0;
  Fault ignored;
  if (!read_locked(policy_.probe_register, 1, &scratch, 1, &ignored)) {
    LOGD(TAG, "prime read failed (%s)", ignored.detail.c_str());
    delay_ms(200);
  }
}
