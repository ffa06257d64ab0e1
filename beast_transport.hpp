#pragma once
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "transport.hpp"

namespace hrstream {

// TLS websocket transport (Boost.Beast over OpenSSL). Peers are verified
// against the system trust store and the endpoint host name.
class BeastTransport : public Transport {
public:
  // `connect_timeout` bounds resolve, TCP connect and both handshakes.
  explicit BeastTransport(boost::asio::io_context& io,
                          std::chrono::milliseconds connect_timeout = std::chrono::seconds(30));
  ~BeastTransport() override;

  void connect(const Endpoint& ep, TransportHandlers handlers) override;
  bool send(std::string frame) override;
  void close() override;

private:
  class Session;

  boost::asio::io_context& io_;
  boost::asio::ssl::context ssl_ctx_;
  std::chrono::milliseconds connect_timeout_;
  std::shared_ptr<Session> session_;
};

} // namespace hrstream
