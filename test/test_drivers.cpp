#include <unity.h>

#include <atomic>
#include <string>
#include <vector>

#include "app/app_config.h"
#include "components/al2205_hub.h"
#include "components/flow_pressure_sd9500.h"
#include "components/flow_sensor_sd6020.h"
#include "components/load_cell.h"
#include "components/position_sensor.h"
#include "components/position_sensor_iol.h"
#include "components/pressure_regulator.h"
#include "components/pressure_sensor.h"
#include "components/process_data.h"
#include "components/ui_button.h"
#include "components/valve_bank.h"
#include "core/calibration_store.h"
#include "core/clock.h"
#include "core/deadline_scheduler.h"
#include "core/monitor.h"
#include "core/port_map.h"
#include "fakes/fake_register_bus.h"

// -------------------------------------------------------------------------------------------------
// Port map / hub
// -------------------------------------------------------------------------------------------------
void test_port_map_addresses_follow_port_stride() {
  uint16_t reg = 0;
  TEST_ASSERT_TRUE(port_map::read_register(1, reg, nullptr));
  TEST_ASSERT_EQUAL_UINT16(1002, reg);
  TEST_ASSERT_TRUE(port_map::write_register(3, reg, nullptr));
  TEST_ASSERT_EQUAL_UINT16(3101, reg);
  TEST_ASSERT_TRUE(port_map::status_register(8, reg, nullptr));
  TEST_ASSERT_EQUAL_UINT16(8001, reg);

  Fault fault;
  TEST_ASSERT_FALSE(port_map::read_register(9, reg, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);

  int port = 0;
  TEST_ASSERT_TRUE(port_map::parse_port_label("X05", port));
  TEST_ASSERT_EQUAL_INT(5, port);
  TEST_ASSERT_FALSE(port_map::parse_port_label("X09", port));
}

void test_hub_channel_offsets() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  bus.set(1003, 11);
  bus.set(1008, 33);
  bus.set(1012, 77);

  uint16_t raw = 0;
  TEST_ASSERT_TRUE(hub.read_channel(0, raw, nullptr));
  TEST_ASSERT_EQUAL_UINT16(11, raw);
  TEST_ASSERT_TRUE(hub.read_channel(3, raw, nullptr));
  TEST_ASSERT_EQUAL_UINT16(33, raw);
  TEST_ASSERT_TRUE(hub.read_channel(7, raw, nullptr));
  TEST_ASSERT_EQUAL_UINT16(77, raw);

  Fault fault;
  TEST_ASSERT_FALSE(hub.read_channel(8, raw, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("invalid_index", fault.reason);
}

void test_hub_read_failure_is_connectivity_fault() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  bus.fail_reads_of(1004);

  uint16_t raw = 0;
  Fault fault;
  TEST_ASSERT_FALSE(hub.read_channel(1, raw, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
}

void test_hub_index_out_of_int_range_is_rejected() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  StepContext ctx;

  ParamMap params {{"X1_index", "4294967296"}};
  Fault fault;
  TEST_ASSERT_FALSE(hub.execute("read_index", params, ctx, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("bad_param", fault.reason);
  TEST_ASSERT_EQUAL_size_t(0, bus.reads_of(1002));
  TEST_ASSERT_EQUAL_size_t(0, bus.reads_of(1003));

  params["X1_index"] = "2";
  TEST_ASSERT_TRUE(hub.execute("read_index", params, ctx, nullptr));
  TEST_ASSERT_EQUAL_size_t(1, bus.reads_of(1007));
}

// -------------------------------------------------------------------------------------------------
// Analog sensors
// -------------------------------------------------------------------------------------------------
void test_load_cell_inverted_voltage_scale() {
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0f, LoadCell::force_from_raw(0, ForceUnit::LBF));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.0f, LoadCell::force_from_raw(5000, ForceUnit::LBF));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.0f, LoadCell::force_from_raw(2500, ForceUnit::LBF));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 25.0f * units::LBF_TO_N, LoadCell::force_from_raw(2500, ForceUnit::NEWTON));

  ForceUnit unit = ForceUnit::LBF;
  TEST_ASSERT_TRUE(parse_force_unit("n", unit, nullptr));
  TEST_ASSERT_EQUAL(ForceUnit::NEWTON, unit);
  Fault fault;
  TEST_ASSERT_FALSE(parse_force_unit("kg", unit, &fault));
  TEST_ASSERT_EQUAL_STRING("invalid_unit", fault.reason);
}

void test_monitor_keeps_polling_after_failed_read() {
  std::atomic<bool> cancel {false};
  std::vector<Reading> seen;
  int reads = 0;
  run_monitor(
    5, 0.0f, &cancel,
    [&reads](Reading& reading, Fault* fault) {
      ++reads;
      if (reads == 2 || reads == 3) {
        return raise_fault(fault, FaultKind::CONNECTIVITY, "read_failed", "gateway unreachable");
      }
      reading.value = static_cast<float>(reads);
      reading.valid = true;
      return true;
    },
    [&seen, &cancel](const Reading& reading) {
      seen.push_back(reading);
      if (seen.size() == 5) cancel = true;
    });

  TEST_ASSERT_EQUAL_size_t(5, seen.size());
  TEST_ASSERT_TRUE(seen[0].valid);
  TEST_ASSERT_FALSE(seen[1].valid);
  TEST_ASSERT_FALSE(seen[2].valid);
  TEST_ASSERT_TRUE(seen[3].valid);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 4.0f, seen[3].value);
}

void test_load_cell_monitor_survives_unreachable_gateway() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  LoadCell cell(hub, 0);
  StepContext ctx;
  bus.set_reachable(false);

  ParamMap params {{"duration", "0.3"}};
  Fault fault;
  TEST_ASSERT_TRUE(cell.execute("monitor_force", params, ctx, &fault));
  TEST_ASSERT_TRUE(fault.ok());
  TEST_ASSERT_TRUE(bus.reads_of(1003) >= 2);
  std::string value;
  TEST_ASSERT_FALSE(cell.log_value(value));

  bus.set_reachable(true);
  bus.set(1003, 2500);
  TEST_ASSERT_TRUE(cell.execute("read_force", ParamMap{}, ctx, nullptr));
  TEST_ASSERT_TRUE(cell.log_value(value));
  TEST_ASSERT_EQUAL_STRING("25.000", value.c_str());
}

void test_pressure_sensor_current_loop() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  PressureSensor sensor(hub, 2);

  TEST_ASSERT_FLOAT_WITHIN(0.01f, -15.0f, sensor.pressure_from_raw(4000));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 145.0f, sensor.pressure_from_raw(20000));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, sensor.pressure_from_raw(12000));

  bus.set(1002 + 5, 12000);
  float psi = 0;
  TEST_ASSERT_TRUE(sensor.read_pressure(psi, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, psi);
}

void test_button_actions() {
  TEST_ASSERT_EQUAL(ButtonAction::START, UiButton::action_from_raw(257));
  TEST_ASSERT_EQUAL(ButtonAction::HOLD, UiButton::action_from_raw(1));
  TEST_ASSERT_EQUAL(ButtonAction::STOP, UiButton::action_from_raw(0));
  TEST_ASSERT_EQUAL(ButtonAction::NONE, UiButton::action_from_raw(42));
}

void test_position_sensor_requires_calibration() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  CalibrationStore store("");
  PositionSensor sensor(hub, 0, store);

  float mm = 0;
  Fault fault;
  TEST_ASSERT_FALSE(sensor.read_position(mm, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("not_calibrated", fault.reason);
  TEST_ASSERT_EQUAL_size_t(0, bus.reads_of(1003));
}

void test_position_sensor_calibrated_reading() {
  FakeRegisterBus bus;
  Al2205Hub hub(bus, 1, 1002);
  CalibrationStore store("");
  PositionSensor sensor(hub, 0, store);

  uint16_t raw = 0;
  bus.set(1003, 1000);
  TEST_ASSERT_TRUE(sensor.calibrate_min(raw, nullptr));
  bus.set(1003, 5000);
  TEST_ASSERT_TRUE(sensor.calibrate_max(raw, nullptr));
  TEST_ASSERT_TRUE(sensor.set_stroke_length(150.0f, nullptr));

  CalibrationRecord cal = store.get("X1.0");
  TEST_ASSERT_TRUE(cal.has_min && cal.has_max && cal.has_stroke);
  TEST_ASSERT_EQUAL_FLOAT(1000.0f, cal.min);

  float mm = 0;
  bus.set(1003, 3000);
  TEST_ASSERT_TRUE(sensor.read_position(mm, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 75.0f, mm);

  bus.set(1003, 6000);
  TEST_ASSERT_TRUE(sensor.read_position(mm, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 150.0f, mm);
  bus.set(1003, 200);
  TEST_ASSERT_TRUE(sensor.read_position(mm, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.0f, mm);
}

void test_position_zero_span_is_configuration_fault() {
  CalibrationRecord cal;
  cal.has_min = cal.has_max = true;
  cal.min = cal.max = 2000;
  float mm = 0;
  Fault fault;
  TEST_ASSERT_FALSE(PositionSensor::position_from_raw(2000, cal, 150.0f, mm, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("zero_span", fault.reason);
}

// -------------------------------------------------------------------------------------------------
// IO-Link process data
// -------------------------------------------------------------------------------------------------
namespace {
// Port 1 in IO-Link mode, 16-byte frame, no swap.
void setup_iolink_port1(FakeRegisterBus& bus) {
  bus.set(AL1342::STATUS_BASE, AL1342::PQI_IOL_MODE);
  bus.set(AL1342::PD_LEN_CFG, 0x03);
  bus.set(AL1342::BYTE_SWAP_CFG, 0x00);
}
} // namespace

void test_frame_assembly_and_byte_swap() {
  const uint16_t regs[] = {0x1234, 0xABCD};
  ProcessDataFrame plain = assemble_frame(regs, 2, 4, false);
  TEST_ASSERT_EQUAL_UINT16(4, plain.length);
  TEST_ASSERT_EQUAL_HEX8(0x12, plain.bytes[0]);
  TEST_ASSERT_EQUAL_HEX8(0xCD, plain.bytes[3]);

  ProcessDataFrame swapped = assemble_frame(regs, 2, 4, true);
  TEST_ASSERT_EQUAL_HEX8(0x34, swapped.bytes[0]);
  TEST_ASSERT_EQUAL_HEX8(0x12, swapped.bytes[1]);

  uint16_t word = 0;
  TEST_ASSERT_TRUE(plain.uint16_at(2, word));
  TEST_ASSERT_EQUAL_HEX16(0xABCD, word);
  TEST_ASSERT_FALSE(plain.uint16_at(3, word));
}

void test_iolink_pqi_gates_frame_read() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(AL1342::STATUS_BASE, AL1342::PQI_IOL_MODE | AL1342::PQI_NOT_CONNECTED);
  FlowPressureSd9500 meter(bus, 1, 1001, 1002, IolinkPortOptions{});
  bus.clear_log();

  Reading flow;
  Fault fault;
  TEST_ASSERT_FALSE(meter.read_flow(flow, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
  TEST_ASSERT_EQUAL_STRING("device_not_connected", fault.reason);
  TEST_ASSERT_EQUAL_size_t(0, bus.reads_of(1002));

  bus.set(AL1342::STATUS_BASE, 0x00);
  fault.clear();
  TEST_ASSERT_FALSE(meter.read_flow(flow, &fault));
  TEST_ASSERT_EQUAL_STRING("not_iolink_mode", fault.reason);
}

void test_sd9500_decodes_flow_temperature_pressure() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(1004, 150);   // bytes 4..5
  bus.set(1006, 2150);  // bytes 8..9
  bus.set(1008, 250);   // bytes 12..13
  FlowPressureSd9500 meter(bus, 1, 1001, 1002, IolinkPortOptions{});
  TEST_ASSERT_EQUAL_UINT16(16, meter.iolink().pd_length());

  Reading r;
  TEST_ASSERT_TRUE(meter.read_flow(r, nullptr));
  TEST_ASSERT_TRUE(r.valid);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 150 * 0.1f * (35.3146667f / 60.0f), r.value);

  TEST_ASSERT_TRUE(meter.read_temperature(r, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 21.5f, r.value);

  TEST_ASSERT_TRUE(meter.read_pressure(r, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 2.5f * units::BAR_TO_PSI, r.value);
}

void test_short_frame_gives_unavailable_reading() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(AL1342::PD_LEN_CFG, 0x01);  // 4 bytes
  FlowPressureSd9500 meter(bus, 1, 1001, 1002, IolinkPortOptions{});

  Reading r;
  TEST_ASSERT_TRUE(meter.read_pressure(r, nullptr));
  TEST_ASSERT_FALSE(r.valid);
}

void test_unknown_length_code_falls_back_to_default() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(AL1342::PD_LEN_CFG, 0x07);
  FlowSensorSd6020 sensor(bus, 1, 1001, 1002, IolinkPortOptions{});
  TEST_ASSERT_EQUAL_UINT16(AL1342::PD_DEFAULT_BYTES, sensor.iolink().pd_length());
}

void test_iolink_config_is_reread_on_refresh() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(AL1342::PD_LEN_CFG, 0x01);
  FlowSensorSd6020 sensor(bus, 1, 1001, 1002, IolinkPortOptions{});
  TEST_ASSERT_EQUAL_UINT16(4, sensor.iolink().pd_length());
  TEST_ASSERT_FALSE(sensor.iolink().byte_swap());

  bus.set(AL1342::PD_LEN_CFG, 0x03);
  bus.set(AL1342::BYTE_SWAP_CFG, 0x01);
  Reading r;
  TEST_ASSERT_TRUE(sensor.read_flow(r, nullptr));
  TEST_ASSERT_EQUAL_UINT16(4, sensor.iolink().pd_length());

  StepContext ctx;
  TEST_ASSERT_TRUE(sensor.execute("refresh_config", ParamMap{}, ctx, nullptr));
  TEST_ASSERT_EQUAL_UINT16(16, sensor.iolink().pd_length());
  TEST_ASSERT_TRUE(sensor.iolink().byte_swap());
}

void test_iolink_config_refreshes_periodically() {
  ParamMap raw_options {{"config_refresh_s", "0.1"}};
  IolinkPortOptions options;
  TEST_ASSERT_TRUE(parse_iolink_options(&raw_options, options, nullptr));
  TEST_ASSERT_EQUAL_UINT32(100, options.refresh_interval_ms);

  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  FlowPressureSd9500 meter(bus, 1, 1001, 1002, options);
  TEST_ASSERT_EQUAL_UINT16(16, meter.iolink().pd_length());

  bus.set(AL1342::PD_LEN_CFG, 0x01);
  bus.clear_log();
  Reading r;
  TEST_ASSERT_TRUE(meter.read_flow(r, nullptr));
  TEST_ASSERT_EQUAL_size_t(0, bus.reads_of(AL1342::PD_LEN_CFG));
  TEST_ASSERT_EQUAL_UINT16(16, meter.iolink().pd_length());

  delay_ms(150);
  TEST_ASSERT_TRUE(meter.read_flow(r, nullptr));
  TEST_ASSERT_EQUAL_size_t(1, bus.reads_of(AL1342::PD_LEN_CFG));
  TEST_ASSERT_EQUAL_UINT16(4, meter.iolink().pd_length());
  TEST_ASSERT_FALSE(r.valid);
}

void test_byte_swap_option_overrides_gateway() {
  FakeRegisterBus bus;
  setup_iolink_port1(bus);
  bus.set(1002, 0xD007);  // 2000 (0x07D0) with bytes swapped
  IolinkPortOptions options;
  ParamMap raw_options {{"byte_swap", "on"}};
  TEST_ASSERT_TRUE(parse_iolink_options(&raw_options, options, nullptr));
  PositionSensorIol sensor(bus, 1, 1001, 1002, options);
  TEST_ASSERT_TRUE(sensor.iolink().byte_swap());

  ProcessDataFrame frame;
  TEST_ASSERT_TRUE(sensor.iolink().read_frame(frame, nullptr));
  Reading r = PositionSensorIol::position_mm(frame);
  TEST_ASSERT_TRUE(r.valid);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 20.0f, r.value);
}

// -------------------------------------------------------------------------------------------------
// Valve bank
// -------------------------------------------------------------------------------------------------
void test_scheduler_clear_waits_for_running_callback() {
  DeadlineScheduler scheduler;
  std::atomic<bool> started {false};
  std::atomic<bool> finished {false};
  std::atomic<bool> late_ran {false};
  TEST_ASSERT_TRUE(scheduler.schedule_after(0, [&started, &finished] {
    started = true;
    delay_ms(200);
    finished = true;
  }) != 0);
  TEST_ASSERT_TRUE(scheduler.schedule_after(300, [&late_ran] { late_ran = true; }) != 0);

  while (!started.load()) delay_ms(1);
  scheduler.clear();
  TEST_ASSERT_TRUE(finished.load());
  TEST_ASSERT_EQUAL_size_t(0, scheduler.pending());
  delay_ms(400);
  TEST_ASSERT_FALSE(late_ran.load());

  // Still accepts work after a clear.
  std::atomic<bool> again {false};
  TEST_ASSERT_TRUE(scheduler.schedule_after(0, [&again] { again = true; }) != 0);
  delay_ms(100);
  TEST_ASSERT_TRUE(again.load());
}

void test_valve_pairing_is_single_write() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);

  TEST_ASSERT_TRUE(valves.valve_on("1.A", nullptr));
  TEST_ASSERT_TRUE(valves.valve_on("1.b", nullptr));

  const std::vector<uint16_t> writes = bus.writes_to(2101);
  TEST_ASSERT_EQUAL_size_t(2, writes.size());
  TEST_ASSERT_EQUAL_HEX16(0x0100, writes[0]);
  TEST_ASSERT_EQUAL_HEX16(0x0200, writes[1]);
  TEST_ASSERT_EQUAL_size_t(1, valves.active_valves().size());
  TEST_ASSERT_EQUAL_STRING("1.B", valves.active_valves().begin()->c_str());
}

void test_valve_invalid_name_leaves_outputs_alone() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);

  Fault fault;
  TEST_ASSERT_FALSE(valves.valve_on("9.A", &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("invalid_valve", fault.reason);

  TEST_ASSERT_TRUE(valves.valve_on("5.A", nullptr));
  fault.clear();
  TEST_ASSERT_FALSE(valves.valve_off({"5.A", "bogus"}, &fault));
  TEST_ASSERT_EQUAL_size_t(1, bus.writes_to(2101).size());
  TEST_ASSERT_EQUAL_HEX16(0x0001, valves.output_word());
}

void test_valve_timed_auto_off() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);

  TEST_ASSERT_TRUE(valves.valve_on("2.A", 0.1f, nullptr));
  TEST_ASSERT_EQUAL_size_t(1, valves.pending_timers());
  delay_ms(400);
  TEST_ASSERT_EQUAL_size_t(0, valves.pending_timers());
  TEST_ASSERT_TRUE(valves.active_valves().empty());
  TEST_ASSERT_EQUAL_HEX16(0x0000, valves.output_word());
}

void test_valve_manual_off_cancels_timer() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);

  TEST_ASSERT_TRUE(valves.valve_on("3.A", 0.2f, nullptr));
  TEST_ASSERT_TRUE(valves.valve_off({"3.A"}, nullptr));
  TEST_ASSERT_EQUAL_size_t(0, valves.pending_timers());
  TEST_ASSERT_TRUE(valves.valve_on("3.A", nullptr));
  delay_ms(400);
  // The cancelled timer must not switch the re-opened valve off.
  TEST_ASSERT_EQUAL_size_t(1, valves.active_valves().size());
  TEST_ASSERT_EQUAL_HEX16(0x1000, valves.output_word());

  TEST_ASSERT_TRUE(valves.all_off(nullptr));
  TEST_ASSERT_EQUAL_HEX16(0x0000, valves.output_word());
}

void test_valve_failed_write_keeps_previous_outputs() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);

  TEST_ASSERT_TRUE(valves.valve_on("1.A", 5.0f, nullptr));
  bus.set_reachable(false);
  Fault fault;
  TEST_ASSERT_FALSE(valves.valve_on("1.B", &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);

  // The gateway still holds 1.A, and so does the bank, timer included.
  TEST_ASSERT_EQUAL_size_t(1, valves.active_valves().size());
  TEST_ASSERT_EQUAL_STRING("1.A", valves.active_valves().begin()->c_str());
  TEST_ASSERT_EQUAL_HEX16(0x0100, valves.output_word());
  TEST_ASSERT_EQUAL_size_t(1, valves.pending_timers());
  std::string logged;
  TEST_ASSERT_TRUE(valves.log_value(logged));
  TEST_ASSERT_EQUAL_STRING("1.A", logged.c_str());

  fault.clear();
  TEST_ASSERT_FALSE(valves.valve_off({"1.A"}, &fault));
  TEST_ASSERT_FALSE(valves.all_off(&fault));
  TEST_ASSERT_EQUAL_HEX16(0x0100, valves.output_word());
  TEST_ASSERT_EQUAL_size_t(1, valves.pending_timers());

  bus.set_reachable(true);
  TEST_ASSERT_TRUE(valves.all_off(nullptr));
  TEST_ASSERT_EQUAL_size_t(0, valves.pending_timers());
  TEST_ASSERT_EQUAL_HEX16(0x0000, valves.output_word());
}

void test_valve_zero_duration_switches_off_at_once() {
  FakeRegisterBus bus;
  DeadlineScheduler scheduler;
  ValveBank valves(bus, 2, 2101, scheduler);
  StepContext ctx;

  ParamMap params;
  params["valve"] = "2.A";
  params["duration"] = "0";
  TEST_ASSERT_TRUE(valves.execute("valve_on", params, ctx, nullptr));
  delay_ms(300);
  TEST_ASSERT_TRUE(valves.active_valves().empty());
  TEST_ASSERT_EQUAL_size_t(0, valves.pending_timers());
  const std::vector<uint16_t> writes = bus.writes_to(2101);
  TEST_ASSERT_EQUAL_size_t(2, writes.size());
  TEST_ASSERT_EQUAL_HEX16(0x0400, writes[0]);
  TEST_ASSERT_EQUAL_HEX16(0x0000, writes[1]);

  Fault fault;
  params["duration"] = "-1";
  TEST_ASSERT_FALSE(valves.execute("valve_on", params, ctx, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
  TEST_ASSERT_EQUAL_STRING("invalid_duration", fault.reason);
  TEST_ASSERT_EQUAL_size_t(2, bus.writes_to(2101).size());
}

// -------------------------------------------------------------------------------------------------
// Pressure regulator
// -------------------------------------------------------------------------------------------------
void test_regulator_curve_clamps() {
  RegulatorCurve curve(15.0f, 115.0f, 65535);
  TEST_ASSERT_EQUAL_UINT16(0, curve.raw_for(15.0f));
  TEST_ASSERT_EQUAL_UINT16(65535, curve.raw_for(115.0f));
  TEST_ASSERT_EQUAL_UINT16(0, curve.raw_for(0.0f));
  TEST_ASSERT_EQUAL_UINT16(65535, curve.raw_for(200.0f));
  TEST_ASSERT_UINT16_WITHIN(1, 32767, curve.raw_for(65.0f));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 115.0f, curve.psi_for(65535));
}

void test_regulator_writes_command_and_reapplies() {
  FakeRegisterBus bus;
  PressureRegulator regulator(bus, 4, 4101, 4002, RegulatorOptions{});
  TEST_ASSERT_FALSE(regulator.has_setpoint());

  TEST_ASSERT_TRUE(regulator.set_pressure(300.0f, nullptr));
  TEST_ASSERT_TRUE(regulator.has_setpoint());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 115.0f, regulator.setpoint());

  TEST_ASSERT_TRUE(regulator.reapply_outputs(nullptr));
  const std::vector<uint16_t> writes = bus.writes_to(4101);
  TEST_ASSERT_EQUAL_size_t(2, writes.size());
  TEST_ASSERT_EQUAL_UINT16(65535, writes[0]);
  TEST_ASSERT_EQUAL_UINT16(65535, writes[1]);

  bus.set(4002, 0);
  float psi = 0;
  uint16_t raw = 1;
  TEST_ASSERT_TRUE(regulator.read_feedback_psi(psi, raw, nullptr));
  TEST_ASSERT_EQUAL_UINT16(0, raw);
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 15.0f, psi);
}

void test_regulator_settle_mode_waits_for_feedback() {
  ParamMap raw_options {{"mode", "settle"}, {"settle_timeout_s", "0.6"}};
  RegulatorOptions options;
  TEST_ASSERT_TRUE(parse_regulator_options(&raw_options, options, nullptr));
  TEST_ASSERT_EQUAL(RegulatorMode::SETTLE, options.mode);
  TEST_ASSERT_EQUAL_UINT32(600, options.settle_timeout_ms);

  FakeRegisterBus bus;
  PressureRegulator regulator(bus, 4, 4101, 4002, options);

  // Feedback already at the target: one read is enough.
  bus.set(4002, regulator.curve().raw_for(65.0f));
  uint32_t begin = millis_now();
  TEST_ASSERT_TRUE(regulator.set_pressure(65.0f, nullptr));
  TEST_ASSERT_TRUE(millis_now() - begin < 300);
  TEST_ASSERT_TRUE(regulator.settled());
  TEST_ASSERT_EQUAL_size_t(1, bus.reads_of(4002));

  // Feedback stuck at the bottom of the range: waits out the timeout, command still issued.
  bus.set(4002, 0);
  begin = millis_now();
  TEST_ASSERT_TRUE(regulator.set_pressure(100.0f, nullptr));
  TEST_ASSERT_TRUE(millis_now() - begin >= 500);
  TEST_ASSERT_FALSE(regulator.settled());
  TEST_ASSERT_TRUE(bus.reads_of(4002) >= 3);
  TEST_ASSERT_EQUAL_size_t(2, bus.writes_to(4101).size());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 100.0f, regulator.setpoint());
}

void test_regulator_options_reject_bad_range() {
  ParamMap options {{"min_psi", "50"}, {"max_psi", "20"}};
  RegulatorOptions out;
  Fault fault;
  TEST_ASSERT_FALSE(parse_regulator_options(&options, out, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONFIGURATION, fault.kind);
}
