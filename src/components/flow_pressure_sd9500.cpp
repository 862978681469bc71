#include "components/flow_pressure_sd9500.h"

#include <cstdio>
#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "sd9500";
constexpr size_t FLOW_OFFSET = 4;
constexpr size_t TEMPERATURE_OFFSET = 8;
constexpr size_t PRESSURE_OFFSET = 12;
constexpr float FLOW_M3H_PER_COUNT = 0.1f;
constexpr float TEMPERATURE_C_PER_COUNT = 0.01f;
constexpr float PRESSURE_BAR_PER_COUNT = 0.01f;

Reading scaled_int16(const ProcessDataFrame& frame, size_t offset, float scale) {
  int16_t counts = 0;
  if (!frame.int16_at(offset, counts)) return Reading{};
  return Reading{counts * scale, true};
}
} // namespace

FlowPressureSd9500::FlowPressureSd9500(IRegisterBus& bus, int port, uint16_t status_register,
                                       uint16_t pdin_register, const IolinkPortOptions& options)
  : iolink_(bus, port, status_register, pdin_register, options) {}

Reading FlowPressureSd9500::flow_cfm(const ProcessDataFrame& frame) {
  return scaled_int16(frame, FLOW_OFFSET, FLOW_M3H_PER_COUNT * units::M3H_TO_CFM);
}

Reading FlowPressureSd9500::temperature_c(const ProcessDataFrame& frame) {
  return scaled_int16(frame, TEMPERATURE_OFFSET, TEMPERATURE_C_PER_COUNT);
}

Reading FlowPressureSd9500::pressure_psi(const ProcessDataFrame& frame) {
  return scaled_int16(frame, PRESSURE_OFFSET, PRESSURE_BAR_PER_COUNT * units::BAR_TO_PSI);
}

bool FlowPressureSd9500::read_flow(Reading& cfm, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  cfm = flow_cfm(frame);
  return true;
}

bool FlowPressureSd9500::read_pressure(Reading& psi, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  psi = pressure_psi(frame);
  return true;
}

bool FlowPressureSd9500::read_temperature(Reading& celsius, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  celsius = temperature_c(frame);
  return true;
}

const DeviceTypeInfo& FlowPressureSd9500::type() const {
  return device_types::FLOW_PRESSURE_SD9500;
}

bool FlowPressureSd9500::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  Reading reading;
  const char* quantity = nullptr;
  const char* unit = nullptr;
  bool ok = false;
  if (strcmp(command, "read_flow") == 0) {
    quantity = "flow";
    unit = "CFM";
    ok = read_flow(reading, fault);
  } else if (strcmp(command, "read_pressure") == 0) {
    quantity = "pressure";
    unit = "psi";
    ok = read_pressure(reading, fault);
  } else if (strcmp(command, "read_temperature") == 0) {
    quantity = "temperature";
    unit = "C";
    ok = read_temperature(reading, fault);
  }
  if (quantity) {
    if (!ok) return false;
    if (!reading.valid) {
      LOGW(TAG, "%s %s unavailable (short frame)", ctx.alias, quantity);
      return true;
    }
    reported_.record(reading.value, 2);
    LOGI(TAG, "%s %s %.2f %s", ctx.alias, quantity, static_cast<double>(reading.value), unit);
    return true;
  }

  if (strcmp(command, "monitor") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(SENSOR_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) {
                  ProcessDataFrame frame;
                  if (!iolink_.read_frame(frame, f)) return false;
                  const Reading flow = flow_cfm(frame);
                  const Reading psi = pressure_psi(frame);
                  if (flow.valid && psi.valid) {
                    char text[48];
                    snprintf(text, sizeof(text), "%.2f CFM / %.2f psi", static_cast<double>(flow.value),
                             static_cast<double>(psi.value));
                    reported_.record_text(text);
                    LOGI(TAG, "%s %s", ctx.alias, text);
                  }
                  reading = flow;
                  return true;
                },
                [&](const Reading& reading) {
                  if (!reading.valid) LOGI(TAG, "%s flow N/A, pressure N/A", ctx.alias);
                });
    return true;
  }

  if (strcmp(command, "refresh_config") == 0) {
    iolink_.refresh_config();
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "FlowPressure_SD9500 has no command '%s'", command);
}
