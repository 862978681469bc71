#pragma once
#include <stdint.h>
#include "config/bench_al1342.h"

// -------- Identity --------
static constexpr const char* BENCH_ID = "mrlf_test_cell_1";

// -------- Gateway configuration --------
static constexpr GatewayConfig GATEWAY_DEFAULTS = BENCH_AL1342_GATEWAY;
static constexpr TransportPolicy TRANSPORT_POLICY = BENCH_AL1342_TRANSPORT;

// Background task periods
static constexpr uint32_t LOGGER_PERIOD_MS         = 100;   // csv row cadence
static constexpr uint32_t LINK_MONITOR_PERIOD_MS   = 1000;  // gateway reachability probe
static constexpr uint32_t SENSOR_MONITOR_PERIOD_MS = 500;   // default monitor() poll
static constexpr uint32_t POSITION_MONITOR_PERIOD_MS = 250;
static constexpr uint32_t WORKER_JOIN_TIMEOUT_MS   = 2000;  // stop(): bounded wait for worker
static constexpr uint32_t LOGGER_JOIN_TIMEOUT_MS   = 2000;

// Regulator settle mode (optional blocking set_pressure)
static constexpr float    REGULATOR_SETTLE_TOLERANCE_PSI = 1.0f;
static constexpr uint32_t REGULATOR_SETTLE_TIMEOUT_MS    = 10000;
static constexpr uint32_t REGULATOR_SETTLE_POLL_MS       = 200;

// Register map for the IFM AL1342 IO-Link master (Modbus TCP).
// Port N (1..8) owns a block of 1000 holding registers.
namespace AL1342 {
enum Reg : uint16_t {
  STATUS_BASE  = 1001,  // PQI in the low byte
  PDIN_BASE    = 1002,  // process data in / analog read base
  PDOUT_BASE   = 1101,  // process data out / write base
  PORT_STRIDE  = 1000,
  PD_LEN_CFG   = 8998,  // low byte: 0:2B 1:4B 2:8B 3:16B 4:32B
  BYTE_SWAP_CFG = 8999  // low byte: nonzero = swap bytes within each word
};

static constexpr uint8_t PORT_MIN = 1;
static constexpr uint8_t PORT_MAX = 8;

static constexpr uint8_t PQI_IOL_MODE      = 0x01;  // bit0: port in IO-Link mode
static constexpr uint8_t PQI_NOT_CONNECTED = 0x02;  // bit1: device not connected

static constexpr uint16_t PD_MAX_BYTES = 32;
static constexpr uint16_t PD_DEFAULT_BYTES = 16;

inline uint16_t pd_len_from_code(uint8_t code) {
  switch (code) {
    case 0x00: return 2;
    case 0x01: return 4;
    case 0x02: return 8;
    case 0x03: return 16;
    case 0x04: return 32;
    default: return 0;
  }
}
} // namespace AL1342

// IFM AL2205 analog hub: X1.0..X1.7 word offsets from the hub's read base.
namespace AL2205 {
static constexpr uint8_t CHANNEL_COUNT = 8;
static constexpr uint16_t CHANNEL_WORD_OFFSET[CHANNEL_COUNT] = {1, 4, 5, 6, 7, 8, 9, 10};
} // namespace AL2205

// Unit conversions shared by the drivers.
namespace units {
static constexpr float M3H_TO_CFM = 35.3146667f / 60.0f;
static constexpr float LBF_TO_N   = 4.44822f;
static constexpr float BAR_TO_PSI = 14.5037738f;
} // namespace units
