#pragma once
#include <stdint.h>

struct GatewayConfig {
  const char* host;
  uint16_t port;
  uint8_t unit_id;
  uint32_t response_timeout_ms;
};

struct TransportPolicy {
  uint8_t open_attempts;      // connection establishment (linear backoff)
  uint32_t open_backoff_ms;
  uint8_t read_retries;       // extra attempts after the first read
  uint32_t read_backoff_ms;
  uint16_t probe_register;    // register read by prime()/probe()
};

#ifndef MRLF_GATEWAY_HOST
#define MRLF_GATEWAY_HOST "192.168.1.250"
#endif

inline constexpr GatewayConfig BENCH_AL1342_GATEWAY{
  .host = MRLF_GATEWAY_HOST,
  .port = 502,
  .unit_id = 1,
  .response_timeout_ms = 2000,
};

inline constexpr TransportPolicy BENCH_AL1342_TRANSPORT{
  .open_attempts = 4,
  .open_backoff_ms = 200,
  .read_retries = 3,
  .read_backoff_ms = 150,
  .probe_register = 0,
};
