#include <unity.h>

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "fakes.hpp"
#include "protocol.hpp"
#include "stream_client.hpp"

using namespace hrstream;
using namespace std::chrono_literals;

namespace {

Endpoint test_endpoint() {
  return *parse_endpoint("wss://stream.test/socket/websocket", "tok");
}

} // namespace

void test_fail_then_close_schedules_one_reconnect() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{20ms, 1000ms});

  client.start();
  TEST_ASSERT_EQUAL_UINT(1, t.connects);
  TEST_ASSERT_EQUAL_INT((int)LinkState::Connecting, (int)client.state());

  t.refuse("connection refused");
  t.drop("socket closed");
  TEST_ASSERT_EQUAL_INT((int)LinkState::ReconnectPending, (int)client.state());
  TEST_ASSERT_EQUAL_UINT(1, client.reconnects_scheduled());

  io.run_for(150ms);
  TEST_ASSERT_EQUAL_UINT(2, t.connects);
  TEST_ASSERT_EQUAL_UINT(2, client.connect_attempts());
  TEST_ASSERT_EQUAL_UINT(1, client.reconnects_scheduled());
  TEST_ASSERT_EQUAL_INT((int)LinkState::Connecting, (int)client.state());
}

void test_connect_joins_every_registered_tracker() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");
  reg.register_tracker("def", "Dan");
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{1000ms, 1000ms});

  client.start();
  TEST_ASSERT_EQUAL_STRING("/socket/websocket?token=tok", t.last_endpoint.target.c_str());
  TEST_ASSERT_EQUAL_UINT(0, t.sent.size());

  t.accept();
  TEST_ASSERT_TRUE(client.connected());
  TEST_ASSERT_EQUAL_UINT(2, t.sent.size());
  TEST_ASSERT_EQUAL_STRING(make_join_frame("abc").c_str(), t.sent[0].c_str());
  TEST_ASSERT_EQUAL_STRING(make_join_frame("def").c_str(), t.sent[1].c_str());
}

void test_join_while_disconnected_is_replayed() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{20ms, 1000ms});

  client.start();
  reg.register_tracker("late", "Lee");
  TEST_ASSERT_FALSE(client.join("late"));
  TEST_ASSERT_EQUAL_UINT(0, t.sent.size());

  t.refuse("timeout");
  io.run_for(100ms);
  TEST_ASSERT_EQUAL_UINT(2, t.connects);

  t.accept();
  TEST_ASSERT_EQUAL_UINT(1, t.count_containing("\"hr:late\""));
  TEST_ASSERT_TRUE(client.join("late"));
  TEST_ASSERT_EQUAL_UINT(2, t.count_containing("\"hr:late\""));
}

void test_keepalive_stops_when_connection_drops() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{5000ms, 20ms});

  client.start();
  t.accept();
  io.run_for(110ms);
  const size_t beats = t.count_containing("\"heartbeat\"");
  TEST_ASSERT_TRUE(beats >= 2);
  TEST_ASSERT_EQUAL_UINT(beats, client.keepalives_sent());

  t.drop("server went away");
  TEST_ASSERT_EQUAL_INT((int)LinkState::ReconnectPending, (int)client.state());
  io.run_for(100ms);
  TEST_ASSERT_EQUAL_UINT(beats, t.count_containing("\"heartbeat\""));
}

void test_non_text_frame_keeps_connection() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{1000ms, 1000ms});
  std::vector<std::string> texts;
  client.set_text_handler([&](std::string_view s) { texts.emplace_back(s); });

  client.start();
  t.accept();
  t.binary(16);
  t.text(R"({"event":"hr_update","topic":"hr:abc","payload":{"hr":70}})");

  TEST_ASSERT_TRUE(client.connected());
  TEST_ASSERT_EQUAL_UINT(1, client.protocol_errors());
  TEST_ASSERT_EQUAL_UINT(0, t.closes);
  TEST_ASSERT_EQUAL_UINT(1, texts.size());
}

void test_stop_cancels_timers_and_closes() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{20ms, 20ms});

  client.start();
  t.accept();
  client.stop();
  TEST_ASSERT_EQUAL_UINT(1, t.closes);
  TEST_ASSERT_EQUAL_INT((int)LinkState::Disconnected, (int)client.state());

  // A close reported after stop must not bring the link back.
  t.open = true;
  t.drop("closed locally");
  io.run_for(100ms);
  TEST_ASSERT_EQUAL_UINT(1, t.connects);
  TEST_ASSERT_EQUAL_UINT(0, client.reconnects_scheduled());
  TEST_ASSERT_EQUAL_UINT(0, t.count_containing("\"heartbeat\""));
}

void test_stop_while_reconnect_pending() {
  boost::asio::io_context io;
  fakes::FakeTransport t;
  TrackerRegistry reg;
  StreamClient client(io, t, reg, test_endpoint(), StreamTiming{20ms, 1000ms});

  client.start();
  t.refuse("refused");
  client.stop();
  io.run_for(100ms);
  TEST_ASSERT_EQUAL_UINT(1, t.connects);
  TEST_ASSERT_EQUAL_UINT(1, client.connect_attempts());
}

void test_default_timing_is_fixed() {
  StreamTiming timing;
  TEST_ASSERT_TRUE(timing.reconnect_delay == 10000ms);
  TEST_ASSERT_TRUE(timing.keepalive_period == 30000ms);
}
