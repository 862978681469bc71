#include "components/flow_sensor_sd6020.h"

#include <cstring>

#include "app/app_config.h"
#include "core/device_registry.h"
#include "core/log.h"
#include "core/monitor.h"
#include "core/step_params.h"

namespace {
constexpr const char* TAG = "sd6020";
constexpr size_t TOTALISER_OFFSET = 0;
constexpr size_t FLOW_OFFSET = 4;
constexpr size_t TEMPERATURE_OFFSET = 6;
constexpr float FLOW_M3H_PER_COUNT = 0.01f;
constexpr float TEMPERATURE_C_PER_COUNT = 0.01f;
} // namespace

FlowSensorSd6020::FlowSensorSd6020(IRegisterBus& bus, int port, uint16_t status_register,
                                   uint16_t pdin_register, const IolinkPortOptions& options)
  : iolink_(bus, port, status_register, pdin_register, options) {}

Reading FlowSensorSd6020::flow_cfm(const ProcessDataFrame& frame) {
  int16_t counts = 0;
  if (!frame.int16_at(FLOW_OFFSET, counts)) return Reading{};
  return Reading{counts * FLOW_M3H_PER_COUNT * units::M3H_TO_CFM, true};
}

Reading FlowSensorSd6020::temperature_c(const ProcessDataFrame& frame) {
  int16_t counts = 0;
  if (!frame.int16_at(TEMPERATURE_OFFSET, counts)) return Reading{};
  return Reading{counts * TEMPERATURE_C_PER_COUNT, true};
}

Reading FlowSensorSd6020::totaliser_m3(const ProcessDataFrame& frame) {
  float m3 = 0;
  if (!frame.float32_at(TOTALISER_OFFSET, m3)) return Reading{};
  return Reading{m3, true};
}

bool FlowSensorSd6020::read_flow(Reading& cfm, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  cfm = flow_cfm(frame);
  return true;
}

bool FlowSensorSd6020::read_temperature(Reading& celsius, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  celsius = temperature_c(frame);
  return true;
}

bool FlowSensorSd6020::read_totaliser(Reading& m3, Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  m3 = totaliser_m3(frame);
  return true;
}

bool FlowSensorSd6020::dump_raw(Fault* fault) {
  ProcessDataFrame frame;
  if (!iolink_.read_frame(frame, fault)) return false;
  uint8_t pqi = 0;
  if (!iolink_.read_pqi(pqi, fault)) return false;

  int16_t flow_raw = 0;
  int16_t temp_raw = 0;
  const bool has_flow = frame.int16_at(FLOW_OFFSET, flow_raw);
  const bool has_temp = frame.int16_at(TEMPERATURE_OFFSET, temp_raw);
  LOGI(TAG, "X0%d PQI=0x%02X len=%u swap=%s flow_raw=%s%d temp_raw=%s%d", iolink_.port(), pqi,
       frame.length, iolink_.byte_swap() ? "on" : "off", has_flow ? "" : "n/a ", flow_raw,
       has_temp ? "" : "n/a ", temp_raw);
  return true;
}

const DeviceTypeInfo& FlowSensorSd6020::type() const {
  return device_types::FLOW_SENSOR_SD6020;
}

bool FlowSensorSd6020::execute(const char* command, const ParamMap& params, StepContext& ctx, Fault* fault) {
  if (strcmp(command, "read_flow") == 0) {
    Reading cfm;
    if (!read_flow(cfm, fault)) return false;
    if (!cfm.valid) {
      LOGW(TAG, "%s flow unavailable (short frame)", ctx.alias);
      return true;
    }
    reported_.record(cfm.value, 3);
    LOGI(TAG, "%s flow %.3f CFM", ctx.alias, static_cast<double>(cfm.value));
    return true;
  }

  if (strcmp(command, "read_temperature") == 0) {
    Reading celsius;
    if (!read_temperature(celsius, fault)) return false;
    if (celsius.valid) {
      reported_.record(celsius.value, 2);
      LOGI(TAG, "%s temperature %.2f C", ctx.alias, static_cast<double>(celsius.value));
    } else {
      LOGW(TAG, "%s temperature unavailable (short frame)", ctx.alias);
    }
    return true;
  }

  if (strcmp(command, "read_totaliser") == 0) {
    Reading m3;
    if (!read_totaliser(m3, fault)) return false;
    if (m3.valid) {
      reported_.record(m3.value, 3);
      LOGI(TAG, "%s totaliser %.3f m3", ctx.alias, static_cast<double>(m3.value));
    } else {
      LOGW(TAG, "%s totaliser unavailable (short frame)", ctx.alias);
    }
    return true;
  }

  if (strcmp(command, "monitor_flow") == 0) {
    float duration_s = 0;
    bool has_duration = false;
    if (!step_params::get_optional_float(params, "duration", duration_s, has_duration, fault)) return false;

    run_monitor(SENSOR_MONITOR_PERIOD_MS, has_duration ? duration_s : 0.0f, ctx.cancel,
                [&](Reading& reading, Fault* f) { return read_flow(reading, f); },
                [&](const Reading& reading) {
                  if (!reading.valid) {
                    LOGI(TAG, "%s flow N/A", ctx.alias);
                    return;
                  }
                  reported_.record(reading.value, 3);
                  LOGI(TAG, "%s flow %.3f CFM", ctx.alias, static_cast<double>(reading.value));
                });
    return true;
  }

  if (strcmp(command, "read_raw") == 0) return dump_raw(fault);

  if (strcmp(command, "refresh_config") == 0) {
    iolink_.refresh_config();
    return true;
  }

  return raise_fault(fault, FaultKind::CONFIGURATION, "unknown_command",
                     "FlowSensor_SD6020 has no command '%s'", command);
}
