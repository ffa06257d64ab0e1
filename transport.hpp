#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "protocol.hpp"

namespace hrstream {

struct TransportHandlers {
  std::function<void()> on_open;
  std::function<void(const std::string& why)> on_connect_failed;
  std::function<void(std::string_view text)> on_text;
  std::function<void(size_t bytes)> on_binary;
  std::function<void(const std::string& why)> on_closed;
};

// Message-oriented duplex connection to one endpoint. All calls and all
// handler invocations happen on the owning io_context's thread.
class Transport {
public:
  virtual ~Transport() = default;

  // Starts a fresh attempt and abandons any previous connection; handlers of
  // the abandoned connection are never invoked again.
  virtual void connect(const Endpoint& ep, TransportHandlers handlers) = 0;
  // Queues a text frame. Returns false if there is no open connection.
  virtual bool send(std::string frame) = 0;
  virtual void close() = 0;
};

} // namespace hrstream
