#include <unity.h>

#include <string>

#include "protocol.hpp"

using namespace hrstream;

void test_join_frame_wire_format() {
  TEST_ASSERT_EQUAL_STRING(
    R"({"topic":"hr:abc","event":"phx_join","payload":{},"ref":0})",
    make_join_frame("abc").c_str());
}

void test_heartbeat_frame_wire_format() {
  TEST_ASSERT_EQUAL_STRING(
    R"({"topic":"phoenix","event":"heartbeat","payload":{},"ref":0})",
    make_heartbeat_frame().c_str());
}

void test_decode_reading_update() {
  auto env = decode_envelope(R"({"event":"hr_update","topic":"hr:abc","payload":{"hr":72}})");
  TEST_ASSERT_TRUE(env.has_value());
  TEST_ASSERT_EQUAL_STRING("hr_update", env->event.c_str());

  auto r = decode_reading(*env);
  TEST_ASSERT_TRUE(r.has_value());
  TEST_ASSERT_EQUAL_STRING("abc", r->tracker_id.c_str());
  TEST_ASSERT_EQUAL_INT(72, r->heart_rate);
}

void test_decode_rejects_garbage() {
  std::string err;
  TEST_ASSERT_FALSE(decode_envelope("{not json", &err).has_value());
  TEST_ASSERT_FALSE(err.empty());

  TEST_ASSERT_FALSE(decode_envelope("[1,2,3]").has_value());
  TEST_ASSERT_FALSE(decode_envelope(R"({"topic":"hr:abc"})").has_value());
  TEST_ASSERT_FALSE(decode_envelope(R"({"event":5})").has_value());
}

void test_decode_reading_schema_errors() {
  auto no_hr = decode_envelope(R"({"event":"hr_update","topic":"hr:abc","payload":{}})");
  TEST_ASSERT_TRUE(no_hr.has_value());
  TEST_ASSERT_FALSE(decode_reading(*no_hr).has_value());

  auto str_hr = decode_envelope(R"({"event":"hr_update","topic":"hr:abc","payload":{"hr":"72"}})");
  TEST_ASSERT_FALSE(decode_reading(*str_hr).has_value());

  auto float_hr = decode_envelope(R"({"event":"hr_update","topic":"hr:abc","payload":{"hr":72.5}})");
  TEST_ASSERT_FALSE(decode_reading(*float_hr).has_value());

  std::string err;
  auto no_delim = decode_envelope(R"({"event":"hr_update","topic":"abc","payload":{"hr":72}})");
  TEST_ASSERT_FALSE(decode_reading(*no_delim, &err).has_value());
  TEST_ASSERT_FALSE(err.empty());
}

void test_tracker_id_from_topic() {
  TEST_ASSERT_EQUAL_STRING("abc", tracker_id_from_topic("hr:abc")->c_str());
  TEST_ASSERT_EQUAL_STRING("abc", tracker_id_from_topic("hr:abc:extra")->c_str());
  TEST_ASSERT_EQUAL_STRING("", tracker_id_from_topic("hr:")->c_str());
  TEST_ASSERT_FALSE(tracker_id_from_topic("phoenix").has_value());
}

void test_parse_endpoint() {
  auto ep = parse_endpoint("wss://app.hyperate.io/socket/websocket", "secret");
  TEST_ASSERT_TRUE(ep.has_value());
  TEST_ASSERT_EQUAL_STRING("app.hyperate.io", ep->host.c_str());
  TEST_ASSERT_EQUAL_STRING("443", ep->port.c_str());
  TEST_ASSERT_EQUAL_STRING("/socket/websocket?token=secret", ep->target.c_str());

  auto with_port = parse_endpoint("wss://localhost:8443/ws?vsn=2.0.0", "t");
  TEST_ASSERT_TRUE(with_port.has_value());
  TEST_ASSERT_EQUAL_STRING("localhost", with_port->host.c_str());
  TEST_ASSERT_EQUAL_STRING("8443", with_port->port.c_str());
  TEST_ASSERT_EQUAL_STRING("/ws?vsn=2.0.0&token=t", with_port->target.c_str());

  auto bare = parse_endpoint("wss://example.org", "t");
  TEST_ASSERT_EQUAL_STRING("/?token=t", bare->target.c_str());

  TEST_ASSERT_FALSE(parse_endpoint("https://example.org/", "t").has_value());
  TEST_ASSERT_FALSE(parse_endpoint("wss://:443/x", "t").has_value());
  TEST_ASSERT_FALSE(parse_endpoint("wss://host:abc/x", "t").has_value());
}

void test_parse_endpoint_encodes_token() {
  auto ep = parse_endpoint("wss://example.org/socket", "a b&c#d%e/f");
  TEST_ASSERT_TRUE(ep.has_value());
  TEST_ASSERT_EQUAL_STRING("/socket?token=a%20b%26c%23d%25e%2Ff", ep->target.c_str());

  auto plain = parse_endpoint("wss://example.org/socket", "Ab-9_.~");
  TEST_ASSERT_EQUAL_STRING("/socket?token=Ab-9_.~", plain->target.c_str());
}
