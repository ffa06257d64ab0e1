#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>

namespace hrstream {

extern bool g_debug;

inline int64_t now_ms() {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch());
  return (int64_t)ms.count();
}

inline const char* timestamp_now_s() {
  static thread_local char buf[20];
  std::time_t t = std::time(nullptr);
  std::tm tm {};
  localtime_r(&t, &tm);
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

} // namespace hrstream

#define ERR (std::cerr << "[" << ::hrstream::timestamp_now_s() << "] ")
#define DBG if (::hrstream::g_debug) ERR
