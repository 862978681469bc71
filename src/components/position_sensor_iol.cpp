#include "components/position_sensor_iol.h"

#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "position_iol";
constexpr size_t POSITION_OFFSET = 0;
constexpr float POSITION_MM_PER_COUNT = 0.01f;
} // namespace

PositionSensorIol::PositionSensorIol(IRegisterBus& bus, int port, uint16_t status_register,
                                     uint16_t pdin_register, const IolinkPortOptions& options)
  : iolink_(bus, port, status_register, pdin_register, options) {}

Reading PositionSensorIol::position_mm(const ProcessDataFrame& frame) {
  int16_t counts = 0;
  if (!frame.int16_at(POSITION_OFFSET, counts)) return Reading{};
  return Reading{counts * POSITION_MM_PER_COUNT, true};
}

bool PositionSensorIol::read_position(Reading& mm, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  mm = position_mm(frame);
  return true;
}

const DeviceTypeInfo& PositionSensorIol::type() const {
  return device_types::POSITION_SENSOR_IOL;
}

bool PositionSensorIol::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "read_position") == 0) {
    Reading mm;
    if (!read_position(mm, fault)) return false;
    if (!mm.valid) {
      LOGW(TAG, "%s position unavailable (short frame)", ctx.alias);
      return true;
    }
    reported_.record(mm.value, 2);
    LOGI(TAG, "%s position %.2f mm", ctx.alias, static_cast<double>(mm.value));
    return true;
  }

  if (strcmp(command, "monitor_position") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(POSITION_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) { return read_position(reading, f); },
                [&](const Reading& reading) {
                  if (!reading.valid) {
                    LOGI(TAG, "%s position N/A", ctx.alias);
                    return;
                  }
                  reported_.record(reading.value, 2);
                  LOGI(TAG, "%s position %.2f mm", ctx.alias, static_cast<double>(reading.value));
                });
    return true;
  }

  if (strcmp(command, "refresh_config") == 0) {
    iolink_.refresh_config();
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "PositionSensor_IOL has no command '%s'", command);
}
