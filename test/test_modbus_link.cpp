#include <unity.h>

#include "core/clock.h"
#include "core/modbus_link.h"
#include "fakes/loopback_gateway.h"

namespace {
constexpr uint8_t FC_READ_HOLDING = 0x03;
constexpr uint8_t FC_WRITE_SINGLE = 0x06;

GatewayConfig loopback_config(uint16_t port) {
  return GatewayConfig{"127.0.0.1", port, 1, 500};
}

TransportPolicy quick_policy() {
  return TransportPolicy{3, 50, 2, 20, 0};
}
} // namespace

void test_link_reads_and_writes_registers() {
  LoopbackGateway gateway;
  TEST_ASSERT_TRUE(gateway.ready());
  gateway.set(10, 1234);
  gateway.set(11, 42);

  ModbusLink link(loopback_config(gateway.port()), quick_policy());
  TEST_ASSERT_TRUE(link.open(nullptr));
  TEST_ASSERT_TRUE(link.is_open());

  uint16_t regs[2] = {0, 0};
  TEST_ASSERT_TRUE(link.read_holding(10, 2, regs, nullptr));
  TEST_ASSERT_EQUAL_UINT16(1234, regs[0]);
  TEST_ASSERT_EQUAL_UINT16(42, regs[1]);

  TEST_ASSERT_TRUE(link.write_holding(20, 0x0100, nullptr));
  TEST_ASSERT_EQUAL_HEX16(0x0100, gateway.get(20));
  TEST_ASSERT_TRUE(link.probe(nullptr));

  TEST_ASSERT_EQUAL_size_t(2, gateway.requests_of(FC_READ_HOLDING));
  TEST_ASSERT_EQUAL_size_t(1, gateway.requests_of(FC_WRITE_SINGLE));
  link.close();
  TEST_ASSERT_FALSE(link.is_open());
}

void test_link_read_reconnects_and_retries() {
  LoopbackGateway gateway;
  TEST_ASSERT_TRUE(gateway.ready());
  gateway.set(5, 777);

  ModbusLink link(loopback_config(gateway.port()), quick_policy());
  TEST_ASSERT_TRUE(link.open(nullptr));
  gateway.drop_next(2);

  uint16_t value = 0;
  TEST_ASSERT_TRUE(link.read_holding(5, 1, &value, nullptr));
  TEST_ASSERT_EQUAL_UINT16(777, value);
  TEST_ASSERT_EQUAL_size_t(3, gateway.requests_of(FC_READ_HOLDING));
  TEST_ASSERT_EQUAL_INT(3, gateway.connections());

  // One more drop than the policy retries: the read gives up.
  gateway.drop_next(3);
  Fault fault;
  TEST_ASSERT_FALSE(link.read_holding(5, 1, &value, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
  TEST_ASSERT_EQUAL_STRING("read_failed", fault.reason);
  TEST_ASSERT_EQUAL_size_t(6, gateway.requests_of(FC_READ_HOLDING));
}

void test_link_write_is_sent_once() {
  LoopbackGateway gateway;
  TEST_ASSERT_TRUE(gateway.ready());

  ModbusLink link(loopback_config(gateway.port()), quick_policy());
  TEST_ASSERT_TRUE(link.open(nullptr));
  gateway.drop_next(1);

  Fault fault;
  TEST_ASSERT_FALSE(link.write_holding(30, 0x0200, &fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
  TEST_ASSERT_EQUAL_STRING("write_failed", fault.reason);
  TEST_ASSERT_EQUAL_size_t(1, gateway.requests_of(FC_WRITE_SINGLE));
  TEST_ASSERT_EQUAL_HEX16(0x0000, gateway.get(30));

  // The next command reconnects.
  TEST_ASSERT_TRUE(link.write_holding(30, 0x0200, nullptr));
  TEST_ASSERT_EQUAL_size_t(2, gateway.requests_of(FC_WRITE_SINGLE));
  TEST_ASSERT_EQUAL_HEX16(0x0200, gateway.get(30));
}

void test_link_open_backs_off_then_fails() {
  LoopbackGateway gateway;
  TEST_ASSERT_TRUE(gateway.ready());
  const uint16_t port = gateway.port();
  gateway.stop();

  ModbusLink link(loopback_config(port), quick_policy());
  Fault fault;
  uint32_t begin = millis_now();
  TEST_ASSERT_FALSE(link.open(&fault));
  // 50 + 100 + 150 ms between the three attempts.
  TEST_ASSERT_TRUE(millis_now() - begin >= 300);
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
  TEST_ASSERT_EQUAL_STRING("open_failed", fault.reason);
  TEST_ASSERT_FALSE(link.is_open());

  begin = millis_now();
  link.prime();
  TEST_ASSERT_TRUE(millis_now() - begin < 2000);
  TEST_ASSERT_FALSE(link.is_open());

  fault.clear();
  TEST_ASSERT_FALSE(link.probe(&fault));
  TEST_ASSERT_EQUAL(FaultKind::CONNECTIVITY, fault.kind);
}
