#include <unity.h>

#include "tracker_registry.hpp"

using hrstream::TrackerRegistry;

void test_register_creates_empty_state() {
  TrackerRegistry reg;
  TEST_ASSERT_TRUE(reg.register_tracker("abc", "Alice"));

  auto st = reg.find("abc");
  TEST_ASSERT_TRUE(st.has_value());
  TEST_ASSERT_EQUAL_STRING("Alice", st->name.c_str());
  TEST_ASSERT_FALSE(st->heart_rate.has_value());
  TEST_ASSERT_EQUAL_INT(0, st->heart_rate_or_zero());
  TEST_ASSERT_TRUE(st->last_update_ms == 0);
  TEST_ASSERT_TRUE(st->last_changed_ms == 0);
}

void test_register_twice_keeps_single_entry() {
  TrackerRegistry reg;
  TEST_ASSERT_TRUE(reg.register_tracker("abc", "Alice"));
  TEST_ASSERT_TRUE(reg.register_tracker("def", "Dan"));
  TEST_ASSERT_FALSE(reg.register_tracker("abc", "Alicia"));

  TEST_ASSERT_EQUAL_UINT(2, reg.size());
  auto ids = reg.ids();
  TEST_ASSERT_EQUAL_UINT(2, ids.size());
  TEST_ASSERT_EQUAL_STRING("abc", ids[0].c_str());
  TEST_ASSERT_EQUAL_STRING("def", ids[1].c_str());
  TEST_ASSERT_EQUAL_STRING("Alicia", reg.find("abc")->name.c_str());
}

void test_reregister_keeps_reading() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");
  reg.apply_reading("abc", 70, 500);
  reg.register_tracker("abc", "Alice");

  auto st = reg.find("abc");
  TEST_ASSERT_EQUAL_INT(70, st->heart_rate_or_zero());
  TEST_ASSERT_TRUE(st->last_changed_ms == 500);
}

void test_unknown_tracker_reading_ignored() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");
  TEST_ASSERT_FALSE(reg.apply_reading("nope", 80, 1000));
  TEST_ASSERT_EQUAL_UINT(1, reg.size());
  TEST_ASSERT_FALSE(reg.contains("nope"));
}

void test_repeated_value_sets_changed_once() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");

  TEST_ASSERT_TRUE(reg.apply_reading("abc", 60, 1000));
  for (int64_t t = 2000; t <= 10000; t += 1000) {
    TEST_ASSERT_TRUE(reg.apply_reading("abc", 60, t));
    auto st = reg.find("abc");
    TEST_ASSERT_TRUE(st->last_changed_ms == 1000);
    TEST_ASSERT_TRUE(st->last_update_ms == t);
  }
}

void test_changing_values_track_update_time() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");

  int hr = 60;
  for (int64_t t = 100; t <= 1000; t += 100) {
    reg.apply_reading("abc", hr++, t);
    auto st = reg.find("abc");
    TEST_ASSERT_TRUE(st->last_changed_ms == st->last_update_ms);
    TEST_ASSERT_TRUE(st->last_changed_ms == t);
  }
}

void test_zero_reading_clears_value() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");

  // 0 on a fresh tracker is not a change.
  reg.apply_reading("abc", 0, 100);
  auto st = reg.find("abc");
  TEST_ASSERT_FALSE(st->heart_rate.has_value());
  TEST_ASSERT_TRUE(st->last_changed_ms == 0);
  TEST_ASSERT_TRUE(st->last_update_ms == 100);

  reg.apply_reading("abc", 72, 200);
  reg.apply_reading("abc", 0, 300);
  st = reg.find("abc");
  TEST_ASSERT_FALSE(st->heart_rate.has_value());
  TEST_ASSERT_TRUE(st->last_changed_ms == 300);
}

void test_snapshot_is_a_copy() {
  TrackerRegistry reg;
  reg.register_tracker("abc", "Alice");
  reg.apply_reading("abc", 65, 10);

  auto snap = reg.snapshot();
  reg.apply_reading("abc", 90, 20);

  TEST_ASSERT_EQUAL_UINT(1, snap.size());
  TEST_ASSERT_EQUAL_INT(65, snap[0].heart_rate_or_zero());
  TEST_ASSERT_EQUAL_INT(90, reg.find("abc")->heart_rate_or_zero());
}
