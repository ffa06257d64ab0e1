#include "dispatcher.hpp"

#include <string>

#include "debug.hpp"
#include "protocol.hpp"

namespace hrstream {

const char* to_str(DispatchResult r) {
  switch (r) {
    case DispatchResult::Applied:        return "applied";
    case DispatchResult::Ignored:        return "ignored";
    case DispatchResult::UnknownTracker: return "unknown_tracker";
    case DispatchResult::Malformed:      return "malformed";
    default: return "unknown";
  }
}

DispatchResult EventDispatcher::on_text(std::string_view text, int64_t now_ms) {
  std::string err;
  auto env = decode_envelope(text, &err);
  if (!env) {
    ERR << "[err] Parse error: " << err << "\n";
    return DispatchResult::Malformed;
  }
  if (env->event != kEventReading) {
    DBG << "[dbg] ignoring event '" << env->event << "' on " << env->topic << "\n";
    return DispatchResult::Ignored;
  }

  auto reading = decode_reading(*env, &err);
  if (!reading) {
    ERR << "[err] Bad " << kEventReading << " frame: " << err << "\n";
    return DispatchResult::Malformed;
  }

  if (!registry_.apply_reading(reading->tracker_id, reading->heart_rate, now_ms)) {
    DBG << "[dbg] reading for unregistered tracker " << reading->tracker_id << "\n";
    return DispatchResult::UnknownTracker;
  }
  DBG << "[dbg] " << reading->tracker_id << " hr=" << reading->heart_rate << "\n";

  if (display_) display_->show(registry_.snapshot(), now_ms);
  return DispatchResult::Applied;
}

} // namespace hrstream
