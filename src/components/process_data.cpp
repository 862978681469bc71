#include "components/process_data.h"

#include <strings.h>

#include <cstring>

#include "core/clock.h"
#include "core/log.h"
#include "core/port_map.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "iolink";
} // namespace

bool parse_byte_swap_mode(const char* text, ByteSwapMode& mode, Fault* fault) {
  if (strcasecmp(text, "auto") == 0) {
    mode = ByteSwapMode::AUTO;
    return true;
  }
  if (strcasecmp(text, "on") == 0 || strcasecmp(text, "true") == 0 || strcmp(text, "1") == 0) {
    mode = ByteSwapMode::ON;
    return true;
  }
  if (strcasecmp(text, "off") == 0 || strcasecmp(text, "false") == 0 || strcmp(text, "0") == 0) {
    mode = ByteSwapMode::OFF;
    return true;
  }
  return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_byte_swap",
                     "byte_swap must be auto, on or off (got '%s')", text);
}

const char* to_str(ByteSwapMode mode) {
  switch (mode) {
    case ByteSwapMode::AUTO: return "auto";
    case ByteSwapMode::ON: return "on";
    case ByteSwapMode::OFF: return "off";
    default: return "unknown";
  }
}

bool check_pqi_byte(uint8_t pqi, int port, Fault* fault) {
  if (pqi & AL1342::PQI_NOT_CONNECTED) {
    return raise_fault(fault, FaultKind::CONNECTIVITY, "device_not_connected",
                       "device not connected on X0%d (PQI=0x%02X)", port, pqi);
  }
  if (!(pqi & AL1342::PQI_IOL_MODE)) {
    return raise_fault(fault, FaultKind::CONNECTIVITY, "not_iolink_mode",
                       "port X0%d not in IO-Link mode (PQI=0x%02X)", port, pqi);
  }
  return true;
}

bool ProcessDataFrame::uint16_at(size_t offset, uint16_t& out) const {
  if (offset + 2 > length) return false;
  out = static_cast<uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
  return true;
}

bool ProcessDataFrame::int16_at(size_t offset, int16_t& out) const {
  uint16_t word = 0;
  if (!uint16_at(offset, word)) return false;
  out = static_cast<int16_t>(word);
  return true;
}

bool ProcessDataFrame::float32_at(size_t offset, float& out) const {
  if (offset + 4 > length) return false;
  const uint32_t bits = (static_cast<uint32_t>(bytes[offset]) << 24) |
                        (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
                        (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
                        static_cast<uint32_t>(bytes[offset + 3]);
  memcpy(&out, &bits, sizeof(out));
  return true;
}

ProcessDataFrame assemble_frame(const uint16_t* regs, size_t reg_count, uint16_t length, bool byte_swap) {
  ProcessDataFrame frame;
  size_t n = 0;
  for (size_t i = 0; i < reg_count && n + 1 < sizeof(frame.bytes); ++i) {
    const uint8_t hi = static_cast<uint8_t>(regs[i] >> 8);
    const uint8_t lo = static_cast<uint8_t>(regs[i] & 0xFF);
    frame.bytes[n++] = byte_swap ? lo : hi;
    frame.bytes[n++] = byte_swap ? hi : lo;
  }
  frame.length = static_cast<uint16_t>(n < length ? n : length);
  return frame;
}

bool parse_iolink_options(const ParamMap* options, IolinkPortOptions& out, Fault* fault) {
  if (!options) return true;
  if (step_params::has(*options, "byte_swap")) {
    std::string text;
    if (!step_params::get_string(*options, "byte_swap", text, fault)) return false;
    if (!parse_byte_swap_mode(text.c_str(), out.swap, fault)) return false;
  }
  if (step_params::has(*options, "config_refresh_s")) {
    float seconds = 0;
    if (!step_params::get_float(*options, "config_refresh_s", seconds, fault)) return false;
    out.refresh_interval_ms = seconds > 0 ? static_cast<uint32_t>(seconds * 1000.0f) : 0;
  }
  return true;
}

IolinkPort::IolinkPort(IRegisterBus& bus, int port, uint16_t status_register, uint16_t pdin_register,
                       const IolinkPortOptions& options)
  : bus_(bus), port_(port), status_register_(status_register), pdin_register_(pdin_register),
    options_(options) {
  refresh_config();
}

bool IolinkPort::resolve(int port, uint16_t& status_register, uint16_t& pdin_register, Fault* fault) {
  return port_map::status_register(port, status_register, fault) &&
         port_map::pdin_register(port, pdin_register, fault);
}

void IolinkPort::refresh_config() {
  uint16_t pd_length = AL1342::PD_DEFAULT_BYTES;
  uint16_t value = 0;
  Fault fault;
  if (read_register(bus_, AL1342::PD_LEN_CFG, value, &fault)) {
    const uint16_t decoded = AL1342::pd_len_from_code(static_cast<uint8_t>(value & 0xFF));
    if (decoded != 0) {
      pd_length = decoded;
    } else {
      LOGW(TAG, "X0%d unknown length code 0x%02X, using %u bytes", port_, value & 0xFF, pd_length);
    }
  } else {
    LOGW(TAG, "X0%d length config unreadable (%s), using %u bytes", port_, fault.detail.c_str(), pd_length);
  }

  bool swap = false;
  if (options_.swap == ByteSwapMode::AUTO) {
    fault.clear();
    if (read_register(bus_, AL1342::BYTE_SWAP_CFG, value, &fault)) {
      swap = (value & 0xFF) != 0;
    } else {
      LOGW(TAG, "X0%d byte swap config unreadable (%s), assuming off", port_, fault.detail.c_str());
    }
  } else {
    swap = options_.swap == ByteSwapMode::ON;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  pd_length_ = pd_length;
  byte_swap_ = swap;
  last_refresh_ms_ = millis_now();
  LOGD(TAG, "X0%d frame %u bytes, swap=%s (%s)", port_, pd_length_, byte_swap_ ? "on" : "off",
       to_str(options_.swap));
}

uint16_t IolinkPort::pd_length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pd_length_;
}

bool IolinkPort::byte_swap() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return byte_swap_;
}

bool IolinkPort::read_pqi(uint8_t& pqi, Fault* fault) {
  uint16_t status = 0;
  if (!read_register(bus_, status_register_, status, fault)) return false;
  pqi = static_cast<uint8_t>(status & 0xFF);
  return true;
}


bool IolinkPort::read_frame(ProcessDataFrame& frame, Fault* fault) {
  bool refresh_due = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_due = options_.refresh_interval_ms > 0 &&
                  millis_now() - last_refresh_ms_ >= options_.refresh_interval_ms;
  }
  if (refresh_due) refresh_config();

  uint8_t pqi = 0;
  if (!read_pqi(pqi, fault) || !check_pqi_byte(pqi, port_, fault)) return false;

  const uint16_t length = pd_length();
  const bool swap = byte_swap();
  const uint16_t reg_count = static_cast<uint16_t>((length + 1) / 2);
  uint16_t regs[AL1342::PD_MAX_BYTES / 2] {};
  if (!bus_.read_holding(pdin_register_, reg_count, regs, fault)) return false;

  frame = assemble_frame(regs, reg_count, length, swap);
  return true;
}
