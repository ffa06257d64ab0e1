#include "stdout_display.hpp"

#include <iostream>
#include <sstream>

#include "debug.hpp"

namespace hrstream {

StdoutDisplay::StdoutDisplay() : out_(std::cout) {}

void StdoutDisplay::show(const std::vector<TrackerState>& snapshot, int64_t now_ms) {
  std::ostringstream body;
  for (const auto& st : snapshot) {
    body << "," << st.id << "=" << st.heart_rate_or_zero();
  }
  std::string b = body.str();

  if (!last_body_.empty() && b == last_body_) {
    ++suppressed_;
    DBG << "[dbg] duplicate snapshot suppressed (" << suppressed_ << ")\n";
    return;
  }
  out_ << now_ms << b << "\n";
  out_.flush();
  last_body_ = std::move(b);
}

} // namespace hrstream
