#pragma once
#include <cstdint>
#include <string_view>

#include "sinks.hpp"
#include "tracker_registry.hpp"

namespace hrstream {

enum class DispatchResult {
  Applied,
  Ignored,         // valid envelope, event we do not act on
  UnknownTracker,  // hr_update for an id that was never registered
  Malformed
};

const char* to_str(DispatchResult r);

class EventDispatcher {
public:
  // `display` may be null (no UI attached yet).
  EventDispatcher(TrackerRegistry& registry, DisplaySink* display)
    : registry_(registry), display_(display) {}

  DispatchResult on_text(std::string_view text, int64_t now_ms);

private:
  TrackerRegistry& registry_;
  DisplaySink* display_;
};

} // namespace hrstream
