#pragma once

#include <stddef.h>
#include <stdint.h>

#include <mutex>

#include "app/app_config.h"
#include "core/device.h"
#include "core/register_bus.h"

enum class ByteSwapMode : uint8_t { AUTO = 0, ON = 1, OFF = 2 };

// "auto", "on"/"true"/"1", "off"/"false"/"0".
bool parse_byte_swap_mode(const char* text, ByteSwapMode& mode, Fault* fault);
const char* to_str(ByteSwapMode mode);

// Process-data bytes in sensor order. Field accessors are big-endian and return false
// when the frame is too short for the field.
struct ProcessDataFrame {
  uint8_t bytes[AL1342::PD_MAX_BYTES] {};
  uint16_t length {0};

  bool int16_at(size_t offset, int16_t& out) const;
  bool uint16_at(size_t offset, uint16_t& out) const;
  bool float32_at(size_t offset, float& out) const;
};

// Unpacks registers into bytes: high byte first, or low byte first when byte_swap is set.
// The result is truncated to `length` bytes.
ProcessDataFrame assemble_frame(const uint16_t* regs, size_t reg_count, uint16_t length, bool byte_swap);

// PQI low byte check: IO-Link mode set and a device connected. Anything else is a
// connectivity fault naming the port.
bool check_pqi_byte(uint8_t pqi, int port, Fault* fault);

struct IolinkPortOptions {
  ByteSwapMode swap {ByteSwapMode::AUTO};
  uint32_t refresh_interval_ms {0};  // 0 = only on construction / explicit refresh
};

bool parse_iolink_options(const ParamMap* options, IolinkPortOptions& out, Fault* fault);

// One IO-Link device attached directly to an AL1342 port. Holds the master-side frame
// configuration (length code 8998, byte swap 8999) and gates every read on the port's PQI.
class IolinkPort {
public:
  IolinkPort(IRegisterBus& bus, int port, uint16_t status_register, uint16_t pdin_register,
             const IolinkPortOptions& options);

  // Resolves status/process-data registers for a port; invalid port is a configuration fault.
  static bool resolve(int port, uint16_t& status_register, uint16_t& pdin_register, Fault* fault);

  // Re-reads 8998/8999. Unreadable or unknown values fall back to defaults; never fails.
  void refresh_config();

  bool read_pqi(uint8_t& pqi, Fault* fault);
  bool read_frame(ProcessDataFrame& frame, Fault* fault);

  int port() const { return port_; }
  uint16_t pd_length() const;
  bool byte_swap() const;

private:
  IRegisterBus& bus_;
  int port_;
  uint16_t status_register_;
  uint16_t pdin_register_;
  IolinkPortOptions options_;

  mutable std::mutex mutex_;
  uint16_t pd_length_ {AL1342::PD_DEFAULT_BYTES};
  bool byte_swap_ {false};
  uint32_t last_refresh_ms_ {0};
};
