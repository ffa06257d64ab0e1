#pragma once
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "bus_control.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "persistence_scheduler.hpp"
#include "sqlite_storage.hpp"
#include "stdout_display.hpp"
#include "stream_client.hpp"
#include "tracker_registry.hpp"
#include "transport.hpp"

namespace hrstream {

struct MonitorOptions {
  std::string config_path;
  bool system_bus{false};
  bool enable_control{true};
  StreamTiming timing{};
  // Defaults to the TLS websocket transport.
  std::function<std::unique_ptr<Transport>(boost::asio::io_context&)> make_transport;
};

// Wires config, registry, stream, dispatcher, persistence and control
// surface together. Network work runs on the calling thread inside run();
// persistence and D-Bus each get their own thread.
class Monitor {
public:
  explicit Monitor(MonitorOptions opts);
  ~Monitor();
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Loads configuration and builds the pipeline. Never fatal for bad or
  // missing config; returns false only if the pipeline cannot be built.
  bool init();

  // Blocks until shutdown() completes. Returns the process exit code.
  int run();

  // io thread only.
  void add_tracker(const std::string& id, const std::string& name);
  void shutdown();

  // Thread-safe entry points for other threads (D-Bus, tests).
  void post_add_tracker(std::string id, std::string name);
  void post_shutdown();

  boost::asio::io_context& io() { return io_; }
  TrackerRegistry& registry() { return registry_; }
  ConfigProvider& config() { return config_; }
  StreamClient* stream() { return stream_.get(); }
  bool stopped() const { return shut_down_; }

private:
  MonitorOptions opts_;
  boost::asio::io_context io_;
  boost::asio::io_context storage_io_;
  boost::asio::signal_set signals_;
  ConfigProvider config_;
  TrackerRegistry registry_;
  SqliteStorage storage_;
  StdoutDisplay display_;
  EventDispatcher dispatcher_;
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<StreamClient> stream_;
  std::unique_ptr<PersistenceScheduler> scheduler_;
  BusControl control_;
  std::thread storage_thread_;
  bool shut_down_{false};
};

} // namespace hrstream
