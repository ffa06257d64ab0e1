#include "tracker_registry.hpp"

#include <utility>

namespace hrstream {

bool TrackerRegistry::register_tracker(const std::string& id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(id);
  if (it != index_.end()) {
    states_[it->second].name = name;
    return false;
  }
  TrackerState st;
  st.id = id;
  st.name = name;
  index_.emplace(id, states_.size());
  states_.push_back(std::move(st));
  return true;
}

bool TrackerRegistry::apply_reading(const std::string& id, int heart_rate, int64_t now_ms) {
  std::optional<int> value;
  if (heart_rate != 0) value = heart_rate;

  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(id);
  if (it == index_.end()) return false;

  TrackerState& st = states_[it->second];
  if (value != st.heart_rate) {
    st.heart_rate = value;
    st.last_changed_ms = now_ms;
  }
  st.last_update_ms = now_ms;
  return true;
}

std::vector<TrackerState> TrackerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_;
}

std::vector<std::string> TrackerRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(states_.size());
  for (const auto& st : states_) out.push_back(st.id);
  return out;
}

std::optional<TrackerState> TrackerRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return states_[it->second];
}

bool TrackerRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return index_.count(id) != 0;
}

size_t TrackerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_.size();
}

} // namespace hrstream
