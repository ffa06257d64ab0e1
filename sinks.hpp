#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "tracker_registry.hpp"

namespace hrstream {

// Passive renderer of registry state. Implementations never mutate the
// registry; they only see copies.
class DisplaySink {
public:
  virtual ~DisplaySink() = default;
  virtual void show(const std::vector<TrackerState>& snapshot, int64_t now_ms) = 0;
};

// Durable per-tracker record store. Both write calls are fire-and-forget for
// the scheduler: a false return has already been logged by the sink.
class StorageSink {
public:
  virtual ~StorageSink() = default;
  virtual bool enabled() const = 0;
  virtual bool ensure_table(const std::string& tracker_id) = 0;
  virtual bool insert_reading(const std::string& tracker_id,
                              const std::string& time_text,
                              int heart_rate) = 0;
};

} // namespace hrstream
