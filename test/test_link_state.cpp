#include <unity.h>

#include "link_state.hpp"

using hrstream::LinkState;
using hrstream::LinkStateMachine;

void test_link_happy_path() {
  LinkStateMachine link;
  TEST_ASSERT_EQUAL_INT((int)LinkState::Disconnected, (int)link.state());
  TEST_ASSERT_TRUE(link.begin_connect());
  TEST_ASSERT_FALSE(link.begin_connect());
  TEST_ASSERT_TRUE(link.opened());
  TEST_ASSERT_EQUAL_INT((int)LinkState::Connected, (int)link.state());
}

void test_link_lost_is_single_flight() {
  LinkStateMachine link;
  link.begin_connect();
  TEST_ASSERT_TRUE(link.lost());   // connect failed
  TEST_ASSERT_FALSE(link.lost());  // close right after
  TEST_ASSERT_FALSE(link.lost());
  TEST_ASSERT_EQUAL_INT((int)LinkState::ReconnectPending, (int)link.state());

  TEST_ASSERT_TRUE(link.begin_connect());
  TEST_ASSERT_TRUE(link.lost());
}

void test_link_halt_blocks_reconnect() {
  LinkStateMachine link;
  link.begin_connect();
  link.opened();
  link.halt();
  TEST_ASSERT_FALSE(link.lost());
  TEST_ASSERT_FALSE(link.begin_connect());
  TEST_ASSERT_EQUAL_INT((int)LinkState::Disconnected, (int)link.state());
}

void test_link_opened_requires_connecting() {
  LinkStateMachine link;
  TEST_ASSERT_FALSE(link.opened());
  link.begin_connect();
  link.lost();
  TEST_ASSERT_FALSE(link.opened());
}
