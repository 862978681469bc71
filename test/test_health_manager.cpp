#include <unity.h>

#include "app/app_config.h"
#include "components/gateway_health.h"
#include "components/port_health.h"
#include "core/health_manager.h"
#include "core/link_monitor.h"
#include "fakes/fake_health_component.h"
#include "fakes/fake_register_bus.h"

void test_required_component_fault_sets_inhibit() {
  HealthManager health;
  FakeHealthComponent link(true, HealthStatus::ERROR, 100);
  TEST_ASSERT_TRUE(health.add(&link));
  health.evaluate(200);

  const SystemHealth sys = health.system_health();
  TEST_ASSERT_EQUAL(HealthStatus::ERROR, sys.system_state);
  TEST_ASSERT_FALSE(sys.run_allowed);
  TEST_ASSERT_EQUAL_UINT16(1, sys.crit_count);
}

void test_optional_component_fault_degrades_only() {
  HealthManager health;
  FakeHealthComponent aux(false, HealthStatus::ERROR, 100);
  TEST_ASSERT_TRUE(health.add(&aux));
  health.evaluate(200);

  const SystemHealth sys = health.system_health();
  TEST_ASSERT_EQUAL(HealthStatus::DEGRADED, sys.system_state);
  TEST_ASSERT_TRUE(sys.run_allowed);
  TEST_ASSERT_EQUAL_UINT16(1, sys.warn_count);
}

void test_stale_required_component_inhibits_run() {
  HealthManager health;
  FakeHealthComponent link(true, HealthStatus::DEGRADED, 100);
  link.stale_ms = 50;
  TEST_ASSERT_TRUE(health.add(&link));
  health.evaluate(120);
  TEST_ASSERT_TRUE(health.system_health().run_allowed);

  health.evaluate(200);
  const SystemHealth sys = health.system_health();
  TEST_ASSERT_EQUAL(HealthStatus::ERROR, sys.system_state);
  TEST_ASSERT_FALSE(sys.run_allowed);
}

void test_unexpected_component_is_ignored() {
  HealthManager health;
  FakeHealthComponent spare(true, HealthStatus::MISSING, 0);
  spare.configure(false, true);
  TEST_ASSERT_TRUE(health.add(&spare));
  health.evaluate(500);
  TEST_ASSERT_EQUAL(HealthStatus::OK, health.system_health().system_state);

  for (size_t i = 1; i < HealthManager::MAX_COMPONENTS; ++i) TEST_ASSERT_TRUE(health.add(&spare));
  TEST_ASSERT_FALSE(health.add(&spare));
}

void test_gateway_health_follows_reachability() {
  FakeRegisterBus bus;
  GatewayHealthComponent gateway(bus);
  HealthManager health;
  gateway.configure(true, true);
  TEST_ASSERT_TRUE(health.add(&gateway));

  health.tick_all(10);
  TEST_ASSERT_EQUAL(HealthStatus::OK, gateway.report().status);
  TEST_ASSERT_TRUE(health.system_health().run_allowed);

  bus.set_reachable(false);
  health.tick_all(20);
  TEST_ASSERT_EQUAL(HealthStatus::MISSING, gateway.report().status);
  TEST_ASSERT_EQUAL_STRING("down", gateway.report().reason);
  TEST_ASSERT_FALSE(health.system_health().run_allowed);

  bus.set_reachable(true);
  health.tick_all(30);
  TEST_ASSERT_TRUE(health.system_health().run_allowed);
  TEST_ASSERT_EQUAL_UINT32(30, gateway.report().last_ok_ms);
}

void test_link_monitor_reports_edges_once() {
  FakeRegisterBus bus;
  GatewayHealthComponent gateway(bus);
  HealthManager health;
  gateway.configure(true, true);
  TEST_ASSERT_TRUE(health.add(&gateway));

  int lost = 0;
  int restored = 0;
  LinkMonitor monitor(health, 1000, [&lost] { lost++; }, [&restored] { restored++; });

  monitor.poll(10);
  TEST_ASSERT_TRUE(monitor.link_ok());
  bus.set_reachable(false);
  monitor.poll(20);
  monitor.poll(30);
  TEST_ASSERT_FALSE(monitor.link_ok());
  TEST_ASSERT_EQUAL_INT(1, lost);
  TEST_ASSERT_EQUAL_INT(0, restored);

  bus.set_reachable(true);
  monitor.poll(40);
  TEST_ASSERT_TRUE(monitor.link_ok());
  TEST_ASSERT_EQUAL_INT(1, restored);
}

void test_iolink_port_health_degrades_without_stopping() {
  FakeRegisterBus bus;
  GatewayHealthComponent gateway(bus);
  IolinkPortHealth port3(bus, 3, 3001);
  HealthManager health;
  gateway.configure(true, true);
  port3.configure(true, false);
  TEST_ASSERT_TRUE(health.add(&gateway));
  TEST_ASSERT_TRUE(health.add(&port3));
  TEST_ASSERT_EQUAL_STRING("X03", port3.name());

  bus.set(3001, AL1342::PQI_IOL_MODE);
  health.tick_all(100);
  TEST_ASSERT_EQUAL(HealthStatus::OK, port3.report().status);
  TEST_ASSERT_EQUAL(HealthStatus::OK, health.system_health().system_state);

  bus.set(3001, AL1342::PQI_IOL_MODE | AL1342::PQI_NOT_CONNECTED);
  health.tick_all(200);
  TEST_ASSERT_EQUAL(HealthStatus::ERROR, port3.report().status);
  TEST_ASSERT_EQUAL_STRING("device_not_connected", port3.report().reason);
  SystemHealth sys = health.system_health();
  TEST_ASSERT_EQUAL(HealthStatus::DEGRADED, sys.system_state);
  TEST_ASSERT_TRUE(sys.run_allowed);
  TEST_ASSERT_EQUAL_UINT16(1, sys.warn_count);

  // PQI unreadable: degraded at once, stale once the window since the last good read passes.
  bus.set(3001, AL1342::PQI_IOL_MODE);
  health.tick_all(300);
  TEST_ASSERT_EQUAL(HealthStatus::OK, health.system_health().system_state);
  bus.fail_reads_of(3001);
  health.tick_all(400);
  TEST_ASSERT_EQUAL(HealthStatus::DEGRADED, port3.report().status);
  TEST_ASSERT_EQUAL(HealthStatus::OK, health.system_health().system_state);
  const uint32_t later = 300 + IolinkPortHealth::STALE_TIMEOUT_MS + 1;
  health.tick_all(later);
  TEST_ASSERT_EQUAL(HealthStatus::STALE, HealthManager::effective_status(port3, later));
  sys = health.system_health();
  TEST_ASSERT_EQUAL(HealthStatus::DEGRADED, sys.system_state);
  TEST_ASSERT_TRUE(sys.run_allowed);
}

void test_health_clear_forgets_components() {
  FakeRegisterBus bus;
  GatewayHealthComponent gateway(bus);
  HealthManager health;
  gateway.configure(true, true);
  TEST_ASSERT_TRUE(health.add(&gateway));
  bus.set_reachable(false);
  health.tick_all(10);
  TEST_ASSERT_FALSE(health.system_health().run_allowed);

  health.clear();
  TEST_ASSERT_EQUAL_size_t(0, health.count());
  TEST_ASSERT_NULL(health.component(0));
  TEST_ASSERT_TRUE(health.system_health().run_allowed);
}
