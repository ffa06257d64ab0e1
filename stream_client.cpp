#include "stream_client.hpp"

#include <utility>

#include "debug.hpp"

namespace hrstream {

StreamClient::StreamClient(boost::asio::io_context& io,
                           Transport& transport,
                           TrackerRegistry& registry,
                           Endpoint endpoint,
                           StreamTiming timing)
  : transport_(transport),
    registry_(registry),
    endpoint_(std::move(endpoint)),
    timing_(timing),
    reconnect_timer_(io),
    keepalive_timer_(io) {}

void StreamClient::start() {
  ERR << "[info] Connecting to " << endpoint_.host << "...\n";
  connect();
}

void StreamClient::stop() {
  if (link_.halted()) return;
  link_.halt();
  ++generation_;  // late callbacks of the current attempt are dropped
  reconnect_timer_.cancel();
  keepalive_timer_.cancel();
  transport_.close();
  DBG << "[dbg] stream client stopped\n";
}

void StreamClient::connect() {
  if (!link_.begin_connect()) return;
  const uint64_t gen = ++generation_;
  ++connect_attempts_;

  TransportHandlers h;
  h.on_open = [this, gen] { on_open(gen); };
  h.on_connect_failed = [this, gen](const std::string& why) {
    if (gen != generation_) return;
    ERR << "[warn] Connect Failed: " << why << "\n";
    on_lost(gen, "connectFailed");
  };
  h.on_closed = [this, gen](const std::string& why) {
    if (gen != generation_) return;
    ERR << "[info] Connection Closed: " << why << "\n";
    on_lost(gen, "connection closed");
  };
  h.on_text = [this, gen](std::string_view text) { on_frame(gen, text); };
  h.on_binary = [this, gen](size_t bytes) { on_binary(gen, bytes); };
  transport_.connect(endpoint_, std::move(h));
}

void StreamClient::on_open(uint64_t gen) {
  if (gen != generation_ || !link_.opened()) return;
  ERR << "[info] Client Connected\n";
  arm_keepalive(gen);
  for (const auto& id : registry_.ids()) join(id);
}

void StreamClient::on_lost(uint64_t gen, const std::string& reason) {
  if (gen != generation_) return;
  keepalive_timer_.cancel();
  if (link_.lost()) schedule_reconnect(reason);
}

void StreamClient::on_frame(uint64_t gen, std::string_view text) {
  if (gen != generation_ || !connected()) return;
  if (on_text_) on_text_(text);
}

void StreamClient::on_binary(uint64_t gen, size_t bytes) {
  if (gen != generation_) return;
  ++protocol_errors_;
  ERR << "[err] Protocol error: non-text frame (" << bytes << " bytes) dropped\n";
}

void StreamClient::schedule_reconnect(const std::string& reason) {
  ++reconnects_scheduled_;
  ERR << "[info] Scheduling reconnect in "
      << std::chrono::duration_cast<std::chrono::seconds>(timing_.reconnect_delay).count()
      << " seconds due to: " << reason << "\n";
  reconnect_timer_.expires_after(timing_.reconnect_delay);
  reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || link_.halted()) return;
    ERR << "[info] Attempting reconnection now...\n";
    connect();
  });
}

void StreamClient::arm_keepalive(uint64_t gen) {
  keepalive_timer_.expires_after(timing_.keepalive_period);
  keepalive_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
    if (ec || gen != generation_ || !connected()) return;
    if (transport_.send(make_heartbeat_frame())) {
      ++keepalives_sent_;
      DBG << "[dbg] heartbeat sent\n";
    }
    arm_keepalive(gen);
  });
}

bool StreamClient::join(const std::string& tracker_id) {
  if (!connected()) {
    DBG << "[dbg] join " << tracker_id << " deferred until connected\n";
    return false;
  }
  if (!transport_.send(make_join_frame(tracker_id))) {
    ERR << "[warn] Join for " << tracker_id << " could not be sent\n";
    return false;
  }
  ERR << "[info] Joined channel for " << tracker_id << "\n";
  return true;
}

} // namespace hrstream
