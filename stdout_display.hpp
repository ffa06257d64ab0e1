#pragma once
#include <iosfwd>
#include <string>

#include "sinks.hpp"

namespace hrstream {

// Prints "<now_ms>,<id>=<bpm>,..." per snapshot. Consecutive snapshots that
// render identically (apart from the timestamp) are suppressed.
class StdoutDisplay : public DisplaySink {
public:
  StdoutDisplay();
  explicit StdoutDisplay(std::ostream& out) : out_(out) {}

  void show(const std::vector<TrackerState>& snapshot, int64_t now_ms) override;

  size_t suppressed() const { return suppressed_; }

private:
  std::ostream& out_;
  std::string last_body_;
  size_t suppressed_{0};
};

} // namespace hrstream
