#include "persistence_scheduler.hpp"

#include <ctime>
#include <exception>

#include <boost/asio/post.hpp>

#include "debug.hpp"

namespace hrstream {

std::string TimeLabeler::next(int64_t epoch_ms) {
  std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm {};
  gmtime_r(&t, &tm);

  char day[11];
  char tod[9];
  std::strftime(day, sizeof(day), "%Y-%m-%d", &tm);
  std::strftime(tod, sizeof(tod), "%H:%M:%S", &tm);

  if (last_day_ != day) {
    last_day_ = day;
    return last_day_ + " " + tod;
  }
  return tod;
}

PersistenceScheduler::PersistenceScheduler(boost::asio::io_context& io,
                                           TrackerRegistry& registry,
                                           StorageSink& storage,
                                           std::chrono::milliseconds interval,
                                           int64_t stale_threshold_ms)
  : io_(io),
    timer_(io),
    registry_(registry),
    storage_(storage),
    interval_(interval.count() >= 1 ? interval : std::chrono::milliseconds(kDefaultWriteIntervalMs)),
    stale_threshold_ms_(stale_threshold_ms >= 1 ? stale_threshold_ms : kDefaultStaleThresholdMs) {}

void PersistenceScheduler::start() {
  if (!storage_.enabled()) {
    ERR << "[info] SQL logging disabled; persistence ticks are no-ops.\n";
  }
  DBG << "[dbg] persistence every " << interval_.count() << "ms, stale after "
      << stale_threshold_ms_ << "ms\n";
  timer_.expires_after(interval_);
  arm();
}

void PersistenceScheduler::stop() {
  stopped_ = true;
  boost::asio::post(io_, [this] { timer_.cancel(); });
}

void PersistenceScheduler::arm() {
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped_) return;
    tick(now_ms());
    // Fixed rate: schedule from the previous deadline, not from now.
    timer_.expires_at(timer_.expiry() + interval_);
    arm();
  });
}

TickStats PersistenceScheduler::tick(int64_t now) {
  TickStats stats;
  const std::string label = labeler_.next(now);
  const bool enabled = storage_.enabled();

  for (const auto& st : registry_.snapshot()) {
    if (!st.heart_rate) {
      ++stats.skipped_empty;
      continue;
    }
    if (now - st.last_changed_ms > stale_threshold_ms_) {
      ++stats.skipped_stale;
      DBG << "[dbg] " << st.id << " stale (" << (now - st.last_changed_ms) << "ms)\n";
      continue;
    }
    if (!enabled) continue;

    try {
      if (storage_.ensure_table(st.id) &&
          storage_.insert_reading(st.id, label, *st.heart_rate)) {
        ++stats.written;
      } else {
        ++stats.failed;
      }
    } catch (const std::exception& e) {
      ++stats.failed;
      ERR << "[err] Error storing data for " << st.id << ": " << e.what() << "\n";
    }
  }
  return stats;
}

} // namespace hrstream
