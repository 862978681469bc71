#include "core/port_map.h"

#include <cstdlib>

#include "app/app_config.h"

namespace {
constexpr uint16_t READ_MAP[AL1342::PORT_MAX] = {1002, 2002, 3002, 4002, 5002, 6002, 7002, 8002};
constexpr uint16_t WRITE_MAP[AL1342::PORT_MAX] = {1101, 2101, 3101, 4101, 5101, 6101, 7101, 8101};

bool lookup(const uint16_t* table, int port, uint16_t& reg, Fault* fault, const char* what) {
  if (!port_map::valid_port(port)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_port",
                       "no %s register mapped to port %d", what, port);
  }
  reg = table[port - 1];
  return true;
}
} // namespace

bool port_map::valid_port(int port) {
  return port >= AL1342::PORT_MIN && port <= AL1342::PORT_MAX;
}

bool port_map::read_register(int port, uint16_t& reg, Fault* fault) {
  return lookup(READ_MAP, port, reg, fault, "read");
}

bool port_map::write_register(int port, uint16_t& reg, Fault* fault) {
  return lookup(WRITE_MAP, port, reg, fault, "write");
}

bool port_map::status_register(int port, uint16_t& reg, Fault* fault) {
  if (!valid_port(port)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_port",
                       "port_number must be 1..8 (got %d)", port);
  }
  reg = static_cast<uint16_t>(AL1342::STATUS_BASE + (port - 1) * AL1342::PORT_STRIDE);
  return true;
}

bool port_map::pdin_register(int port, uint16_t& reg, Fault* fault) {
  if (!valid_port(port)) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_port",
                       "port_number must be 1..8 (got %d)", port);
  }
  reg = static_cast<uint16_t>(AL1342::PDIN_BASE + (port - 1) * AL1342::PORT_STRIDE);
  return true;
}

bool port_map::parse_port_label(const char* label, int& port) {
  if (!label || !*label) return false;
  const char* digits = (label[0] == 'X' || label[0] == 'x') ? label + 1 : label;
  char* end = nullptr;
  const long value = strtol(digits, &end, 10);
  if (end == digits || *end != '\0') return false;
  if (!valid_port(static_cast<int>(value))) return false;
  port = static_cast<int>(value);
  return true;
}
