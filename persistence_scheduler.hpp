#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config.hpp"
#include "sinks.hpp"
#include "tracker_registry.hpp"

namespace hrstream {

// Builds the time_text column value. The first label and the first label of
// every new UTC day carry the date ("2024-05-01 23:59:59"), all others only
// the time of day ("00:00:01").
class TimeLabeler {
public:
  std::string next(int64_t epoch_ms);

private:
  std::string last_day_;
};

struct TickStats {
  size_t written{0};
  size_t skipped_empty{0};
  size_t skipped_stale{0};
  size_t failed{0};
};

// Periodically copies fresh readings from the registry into the storage
// sink. Runs on its own io_context so storage latency never delays the
// network side.
class PersistenceScheduler {
public:
  PersistenceScheduler(boost::asio::io_context& io,
                       TrackerRegistry& registry,
                       StorageSink& storage,
                       std::chrono::milliseconds interval,
                       int64_t stale_threshold_ms);

  void start();
  // Safe to call from any thread. No tick starts after this returns.
  void stop();

  // A single pass over the registry at wall-clock time `now_ms`.
  TickStats tick(int64_t now_ms);

  std::chrono::milliseconds interval() const { return interval_; }
  int64_t stale_threshold_ms() const { return stale_threshold_ms_; }

private:
  void arm();

  boost::asio::io_context& io_;
  boost::asio::steady_timer timer_;
  TrackerRegistry& registry_;
  StorageSink& storage_;
  std::chrono::milliseconds interval_;
  int64_t stale_threshold_ms_;
  TimeLabeler labeler_;
  std::atomic<bool> stopped_{false};
};

} // namespace hrstream
