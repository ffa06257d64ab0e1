#include "beast_transport.hpp"

#include <chrono>
#include <deque>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "debug.hpp"

namespace hrstream {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

class BeastTransport::Session : public std::enable_shared_from_this<Session> {
public:
  Session(asio::io_context& io, ssl::context& ctx, Endpoint ep, TransportHandlers h,
          std::chrono::milliseconds connect_timeout)
    : resolver_(io), deadline_(io), ws_(io, ctx), ep_(std::move(ep)),
      handlers_(std::move(h)), connect_timeout_(connect_timeout) {}

  void start() {
    // One deadline for resolve, TCP connect and both handshakes.
    deadline_.expires_after(connect_timeout_);
    deadline_.async_wait(
      beast::bind_front_handler(&Session::on_deadline, shared_from_this()));

    DBG << "[dbg] resolving " << ep_.host << ":" << ep_.port << "\n";
    resolver_.async_resolve(ep_.host, ep_.port,
      beast::bind_front_handler(&Session::on_resolve, shared_from_this()));
  }

  bool send(std::string frame) {
    if (!open_ || closing_) return false;
    queue_.push_back(std::move(frame));
    if (queue_.size() == 1) do_write();
    return true;
  }

  void close() {
    if (closing_ || finished_) return;
    closing_ = true;
    if (open_) {
      ws_.async_close(websocket::close_code::normal,
        beast::bind_front_handler(&Session::on_close, shared_from_this()));
    } else {
      release();
    }
  }

  // Detach from the owner: no handler fires after this, and the socket is
  // closed even if the session already finished.
  void abandon() {
    handlers_ = TransportHandlers{};
    close();
    if (finished_) release();
  }

private:
  // Cancels everything in flight and drops the TCP connection.
  void release() {
    deadline_.cancel();
    resolver_.cancel();
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
  }

  void on_deadline(beast::error_code ec) {
    if (ec || open_ || finished_) return;
    ERR << "[warn] Connecting to " << ep_.host << " timed out after "
        << connect_timeout_.count() << "ms\n";
    timed_out_ = true;
    release();
  }

  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail("resolve", ec);
    beast::get_lowest_layer(ws_).async_connect(results,
      beast::bind_front_handler(&Session::on_connect, shared_from_this()));
  }

  void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail("connect", ec);

    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), ep_.host.c_str())) {
      ec = beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
      return fail("sni", ec);
    }
    ws_.next_layer().set_verify_callback(ssl::host_name_verification(ep_.host));

    ws_.next_layer().async_handshake(ssl::stream_base::client,
      beast::bind_front_handler(&Session::on_ssl_handshake, shared_from_this()));
  }

  void on_ssl_handshake(beast::error_code ec) {
    if (ec) return fail("tls handshake", ec);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, "hrstream");
    }));

    std::string host = ep_.host;
    if (ep_.port != "443") host += ":" + ep_.port;
    ws_.async_handshake(host, ep_.target,
      beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
  }

  void on_handshake(beast::error_code ec) {
    if (ec) return fail("websocket handshake", ec);
    open_ = true;
    deadline_.cancel();
    if (closing_) {
      close_after_open();
      return;
    }
    auto h = handlers_.on_open;
    if (h) h();
    do_read();
  }

  void close_after_open() {
    ws_.async_close(websocket::close_code::normal,
      beast::bind_front_handler(&Session::on_close, shared_from_this()));
  }

  void do_read() {
    ws_.async_read(buffer_,
      beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes) {
    if (ec) {
      if (ec == websocket::error::closed) {
        return finish("closed by peer (" + std::to_string(static_cast<int>(ws_.reason().code)) + ")");
      }
      if (closing_ && ec == asio::error::operation_aborted) return;
      return finish(ec.message());
    }

    if (ws_.got_text()) {
      std::string text = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());
      auto h = handlers_.on_text;
      if (h) h(text);
    } else {
      buffer_.consume(buffer_.size());
      auto h = handlers_.on_binary;
      if (h) h(bytes);
    }
    if (!finished_) do_read();
  }

  void do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(queue_.front()),
      beast::bind_front_handler(&Session::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      queue_.clear();
      if (closing_ && ec == asio::error::operation_aborted) return;
      return finish("write: " + ec.message());
    }
    queue_.pop_front();
    if (!queue_.empty() && !closing_) do_write();
  }

  void on_close(beast::error_code ec) {
    if (ec) {
      DBG << "[dbg] websocket close: " << ec.message() << "\n";
    }
    finish("closed locally");
  }

  void fail(const char* what, beast::error_code ec) {
    if (finished_) return;
    finished_ = true;
    release();
    if (closing_ && ec == asio::error::operation_aborted) return;
    auto h = handlers_.on_connect_failed;
    if (h) h(std::string(what) + ": " + (timed_out_ ? std::string("timed out") : ec.message()));
  }

  void finish(const std::string& why) {
    if (finished_) return;
    finished_ = true;
    open_ = false;
    release();
    auto h = handlers_.on_closed;
    if (h) h(why);
  }

  tcp::resolver resolver_;
  asio::steady_timer deadline_;
  websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  beast::flat_buffer buffer_;
  std::deque<std::string> queue_;
  Endpoint ep_;
  TransportHandlers handlers_;
  std::chrono::milliseconds connect_timeout_;
  bool open_{false};
  bool closing_{false};
  bool finished_{false};
  bool timed_out_{false};
};

BeastTransport::BeastTransport(asio::io_context& io, std::chrono::milliseconds connect_timeout)
  : io_(io), ssl_ctx_(ssl::context::tlsv12_client), connect_timeout_(connect_timeout) {
  beast::error_code ec;
  ssl_ctx_.set_default_verify_paths(ec);
  if (ec) {
    ERR << "[warn] Cannot load system CA certificates: " << ec.message() << "\n";
  }
  ssl_ctx_.set_verify_mode(ssl::verify_peer, ec);
  if (ec) {
    ERR << "[warn] Cannot enable peer verification: " << ec.message() << "\n";
  }
}

BeastTransport::~BeastTransport() {
  if (session_) session_->abandon();
}

void BeastTransport::connect(const Endpoint& ep, TransportHandlers handlers) {
  if (session_) session_->abandon();
  session_ = std::make_shared<Session>(io_, ssl_ctx_, ep, std::move(handlers), connect_timeout_);
  session_->start();
}

bool BeastTransport::send(std::string frame) {
  return session_ && session_->send(std::move(frame));
}

void BeastTransport::close() {
  if (session_) session_->close();
}

} // namespace hrstream
