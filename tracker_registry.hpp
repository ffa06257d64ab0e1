#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hrstream {

struct TrackerState {
  std::string id;
  std::string name;
  // Absent until a non-zero reading arrives; a reading of 0 clears it again.
  std::optional<int> heart_rate;
  int64_t last_update_ms{0};
  int64_t last_changed_ms{0};

  int heart_rate_or_zero() const { return heart_rate.value_or(0); }
};

// Process-lifetime map of tracker id -> freshness state. Entries are never
// removed. All members are safe to call from any thread.
class TrackerRegistry {
public:
  // Returns true if `id` was not known before. For a known id the name is
  // reasserted and false is returned.
  bool register_tracker(const std::string& id, const std::string& name);

  // Records an inbound reading. Unknown ids are ignored (returns false).
  // last_changed_ms only moves when the value differs from the stored one.
  bool apply_reading(const std::string& id, int heart_rate, int64_t now_ms);

  std::vector<TrackerState> snapshot() const;
  std::vector<std::string> ids() const;
  std::optional<TrackerState> find(const std::string& id) const;
  bool contains(const std::string& id) const;
  size_t size() const;

private:
  mutable std::mutex mu_;
  std::vector<TrackerState> states_;  // registration order
  std::unordered_map<std::string, size_t> index_;
};

} // namespace hrstream
