#include "components/al2205_hub.h"

#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/port_map.h"
#include "core/step_params.h"

Al2205Hub::Al2205Hub(IRegisterBus& bus, int port, uint16_t base_register)
  : bus_(bus), port_(port), base_register_(base_register) {}

std::unique_ptr<Al2205Hub> Al2205Hub::create(IRegisterBus& bus, int port, Fault* fault) {
  uint16_t base = 0;
  if (!port_map::read_register(port, base, fault)) return nullptr;
  return std::make_unique<Al2205Hub>(bus, port, base);
}

bool Al2205Hub::channel_register(uint16_t base_register, int index, uint16_t& reg, Fault* fault) {
  if (index < 0 || index >= AL2205::CHANNEL_COUNT) {
    return raise_fault(fault, FaultKind::CONFIGURATION, "invalid_index",
                       "invalid X1 index %d for analog read, must be between 0 and 7", index);
  }
  reg = static_cast<uint16_t>(base_register + AL2205::CHANNEL_WORD_OFFSET[index]);
  return true;
}

bool Al2205Hub::read_channel(int index, uint16_t& raw, Fault* fault) {
  uint16_t reg = 0;
  if (!channel_register(base_register_, index, reg, fault)) return false;
  return read_register(bus_, reg, raw, fault);
}

const DeviceTypeInfo& Al2205Hub::type() const {
  return device_types::AL2205_HUB;
}

bool Al2205Hub::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  (void)ctx;
  if (strcmp(command, "read_index") == 0) {
    int index = 0;
    if (!step_params::get_int(params, "X1_index", index, fault)) return false;
    uint16_t raw = 0;
    if (!read_channel(index, raw, fault)) return false;
    LOGI("hub", "X1.%d raw=%u", index, raw);
    return true;
  }
  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "AL2205_Hub has no command '%s'", command);
}
