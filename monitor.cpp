#include "monitor.hpp"

#include <csignal>
#include <cstdlib>
#include <utility>

#include <boost/asio/post.hpp>

#include "beast_transport.hpp"
#include "debug.hpp"
#include "protocol.hpp"

namespace hrstream {

namespace {

std::string getenv_or(const char* key, const std::string& defv) {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : defv;
}

} // namespace

Monitor::Monitor(MonitorOptions opts)
  : opts_(std::move(opts)),
    signals_(io_, SIGINT, SIGTERM),
    config_(opts_.config_path.empty() ? ConfigProvider::default_path() : opts_.config_path),
    dispatcher_(registry_, &display_),
    control_(ControlHooks{
      [this](const std::string& id, const std::string& name) { post_add_tracker(id, name); },
      [this] { post_shutdown(); },
      [this] { return registry_.snapshot(); }}) {}

Monitor::~Monitor() {
  control_.stop();
  if (scheduler_) scheduler_->stop();
  if (storage_thread_.joinable()) storage_thread_.join();
  storage_.close();
}

bool Monitor::init() {
  Config cfg = config_.load();
  ERR << "[info] Config: " << config_.path() << "\n";

  for (const auto& t : cfg.trackers) {
    registry_.register_tracker(t.id, t.name);
  }

  if (cfg.sql_enabled) {
    if (!storage_.open(cfg.db_path)) {
      ERR << "[warn] Persistence disabled: database unavailable.\n";
    }
  } else {
    ERR << "[info] SQL logging disabled (sqlEnabled=false).\n";
  }

  std::string api_key = getenv_or("HRSTREAM_API_KEY", cfg.api_key);
  if (api_key.empty()) {
    ERR << "[warn] No API key configured; the upstream service will likely refuse the connection.\n";
  }
  auto ep = parse_endpoint(cfg.endpoint, api_key);
  if (!ep) {
    ERR << "[warn] Invalid endpoint '" << cfg.endpoint << "'; using " << kDefaultEndpoint << "\n";
    ep = parse_endpoint(kDefaultEndpoint, api_key);
    if (!ep) return false;
  }

  transport_ = opts_.make_transport ? opts_.make_transport(io_)
                                    : std::make_unique<BeastTransport>(io_);
  if (!transport_) return false;

  stream_ = std::make_unique<StreamClient>(io_, *transport_, registry_, *ep, opts_.timing);
  stream_->set_text_handler([this](std::string_view text) {
    DispatchResult r = dispatcher_.on_text(text, now_ms());
    if (r != DispatchResult::Applied) DBG << "[dbg] frame " << to_str(r) << "\n";
  });

  scheduler_ = std::make_unique<PersistenceScheduler>(
    storage_io_, registry_, storage_,
    std::chrono::milliseconds(cfg.write_interval_ms), cfg.stale_threshold_ms);
  return true;
}

int Monitor::run() {
  if (!stream_ || !scheduler_) {
    ERR << "[err] run() called before a successful init()\n";
    return EXIT_FAILURE;
  }

  scheduler_->start();
  storage_thread_ = std::thread([this] { storage_io_.run(); });

  signals_.async_wait([this](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    ERR << "[info] Signal " << sig << " received\n";
    shutdown();
  });

  if (opts_.enable_control && !control_.start(opts_.system_bus)) {
    ERR << "[warn] Continuing without D-Bus control surface.\n";
  }

  stream_->start();
  io_.run();

  shutdown();
  if (storage_thread_.joinable()) storage_thread_.join();
  storage_.close();
  ERR << "[info] Stopped.\n";
  return EXIT_SUCCESS;
}

void Monitor::add_tracker(const std::string& id, const std::string& name) {
  if (registry_.register_tracker(id, name)) {
    if (config_.add_tracker(id, name)) {
      ERR << "[info] Config saved successfully.\n";
    }
  }
  ERR << "[info] Adding new heart rate tracker: " << id << " (" << name << ")\n";
  if (stream_ && stream_->connected()) stream_->join(id);
}

void Monitor::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  ERR << "[info] Shutting down...\n";
  if (stream_) stream_->stop();
  if (scheduler_) scheduler_->stop();
  control_.stop();
  boost::system::error_code ec;
  signals_.cancel(ec);
}

void Monitor::post_add_tracker(std::string id, std::string name) {
  boost::asio::post(io_, [this, id = std::move(id), name = std::move(name)] {
    add_tracker(id, name);
  });
}

void Monitor::post_shutdown() {
  boost::asio::post(io_, [this] { shutdown(); });
}

} // namespace hrstream
