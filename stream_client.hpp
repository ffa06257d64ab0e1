#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "link_state.hpp"
#include "protocol.hpp"
#include "tracker_registry.hpp"
#include "transport.hpp"

namespace hrstream {

struct StreamTiming {
  std::chrono::milliseconds reconnect_delay{10000};
  std::chrono::milliseconds keepalive_period{30000};
};

// Keeps one subscription connection alive: joins every registered tracker's
// channel on connect, sends the Phoenix heartbeat while connected and
// reconnects after a fixed delay when the link drops. Must be driven from the
// io_context thread.
class StreamClient {
public:
  using TextHandler = std::function<void(std::string_view text)>;

  StreamClient(boost::asio::io_context& io,
               Transport& transport,
               TrackerRegistry& registry,
               Endpoint endpoint,
               StreamTiming timing = {});

  void set_text_handler(TextHandler h) { on_text_ = std::move(h); }

  void start();
  // Cancels both timers and closes the connection. Final.
  void stop();

  // Sends a channel join if connected; otherwise the join is replayed on the
  // next connect. Returns true if a frame was sent.
  bool join(const std::string& tracker_id);

  LinkState state() const { return link_.state(); }
  bool connected() const { return link_.state() == LinkState::Connected; }

  size_t connect_attempts() const { return connect_attempts_; }
  size_t reconnects_scheduled() const { return reconnects_scheduled_; }
  size_t keepalives_sent() const { return keepalives_sent_; }
  size_t protocol_errors() const { return protocol_errors_; }

private:
  void connect();
  void on_open(uint64_t gen);
  void on_lost(uint64_t gen, const std::string& reason);
  void on_frame(uint64_t gen, std::string_view text);
  void on_binary(uint64_t gen, size_t bytes);
  void schedule_reconnect(const std::string& reason);
  void arm_keepalive(uint64_t gen);

  Transport& transport_;
  TrackerRegistry& registry_;
  Endpoint endpoint_;
  StreamTiming timing_;
  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer keepalive_timer_;
  LinkStateMachine link_;
  TextHandler on_text_;

  uint64_t generation_{0};
  size_t connect_attempts_{0};
  size_t reconnects_scheduled_{0};
  size_t keepalives_sent_{0};
  size_t protocol_errors_{0};
};

} // namespace hrstream
