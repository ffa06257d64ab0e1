#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hrstream {

inline constexpr const char* kDefaultEndpoint = "wss://app.hyperate.io/socket/websocket";
inline constexpr const char* kDefaultDbPath = "heartmonitor.db";
inline constexpr int64_t kDefaultWriteIntervalMs = 2000;
inline constexpr int64_t kDefaultStaleThresholdMs = 8000;

struct TrackerEntry {
  std::string id;
  std::string name;
};

struct Config {
  bool sql_enabled{false};
  std::string db_path{kDefaultDbPath};
  int64_t write_interval_ms{kDefaultWriteIntervalMs};
  int64_t stale_threshold_ms{kDefaultStaleThresholdMs};
  std::string endpoint{kDefaultEndpoint};
  std::string api_key;
  std::vector<TrackerEntry> trackers;
};

// Lenient conversion: anything missing or invalid falls back to the default
// for that field. Never throws.
Config config_from_json(const nlohmann::ordered_json& j);

// Owns config.json. Loading never fails; a missing file is created with
// defaults, a corrupt one is replaced in memory by defaults.
class ConfigProvider {
public:
  explicit ConfigProvider(std::string path) : path_(std::move(path)) {}

  // $XDG_CONFIG_HOME/hrstream/config.json or ~/.config/hrstream/config.json
  static std::string default_path();

  Config load();

  // Appends the tracker and writes the file back. Returns false if the
  // write failed (already logged); the in-memory list is updated either way.
  bool add_tracker(const std::string& id, const std::string& name);

  const std::string& path() const { return path_; }

private:
  bool save_locked();

  std::string path_;
  mutable std::mutex mu_;
  Config cfg_;
  nlohmann::ordered_json doc_ = nlohmann::ordered_json::object();  // keeps unknown keys on write-back
};

} // namespace hrstream
