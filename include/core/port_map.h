#pragma once

#include <stdint.h>

#include "core/fault.h"

// AL1342 port -> register address maps. Every driver resolves its registers here;
// an unmapped port is a configuration fault at construction time.
namespace port_map {

bool valid_port(int port);

bool read_register(int port, uint16_t& reg, Fault* fault);     // 1002 + 1000*(port-1)
bool write_register(int port, uint16_t& reg, Fault* fault);    // 1101 + 1000*(port-1)
bool status_register(int port, uint16_t& reg, Fault* fault);   // 1001 + 1000*(port-1)
bool pdin_register(int port, uint16_t& reg, Fault* fault);     // same family as read_register

// Parses "X01".."X08" (or a bare "1".."8").
bool parse_port_label(const char* label, int& port);

} // namespace port_map
