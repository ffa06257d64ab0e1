#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "debug.hpp"

namespace hrstream {

namespace {

std::string getenv_or(const char* key, const char* defv) {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : std::string(defv);
}

int64_t positive_or(const nlohmann::ordered_json& j, const char* key, int64_t defv) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return defv;
  double v = it->get<double>();
  if (!(v >= 1.0) || v > 9.0e15) return defv;  // also rejects NaN
  return static_cast<int64_t>(v);
}

std::string string_or(const nlohmann::ordered_json& j, const char* key, const std::string& defv) {
  auto it = j.find(key);
  return (it != j.end() && it->is_string()) ? it->get<std::string>() : defv;
}

nlohmann::ordered_json trackers_to_json(const std::vector<TrackerEntry>& trackers) {
  nlohmann::ordered_json arr = nlohmann::ordered_json::array();
  for (const auto& t : trackers) {
    arr.push_back({{"id", t.id}, {"name", t.name}});
  }
  return arr;
}

void fill_json(nlohmann::ordered_json& doc, const Config& c) {
  doc["sqlEnabled"] = c.sql_enabled;
  doc["dbPath"] = c.db_path;
  doc["dbWriteIntervalMs"] = c.write_interval_ms;
  doc["staleThresholdMs"] = c.stale_threshold_ms;
  doc["endpoint"] = c.endpoint;
  doc["apiKey"] = c.api_key;
  doc["trackers"] = trackers_to_json(c.trackers);
}

} // namespace

Config config_from_json(const nlohmann::ordered_json& j) {
  Config c;
  if (!j.is_object()) return c;

  auto sql = j.find("sqlEnabled");
  if (sql != j.end() && sql->is_boolean()) c.sql_enabled = sql->get<bool>();

  c.db_path = string_or(j, "dbPath", c.db_path);
  c.endpoint = string_or(j, "endpoint", c.endpoint);
  c.api_key = string_or(j, "apiKey", c.api_key);
  c.write_interval_ms = positive_or(j, "dbWriteIntervalMs", kDefaultWriteIntervalMs);
  c.stale_threshold_ms = positive_or(j, "staleThresholdMs", kDefaultStaleThresholdMs);

  auto trackers = j.find("trackers");
  if (trackers != j.end() && trackers->is_array()) {
    for (const auto& t : *trackers) {
      if (!t.is_object()) continue;
      auto id = t.find("id");
      if (id == t.end() || !id->is_string() || id->get<std::string>().empty()) continue;
      c.trackers.push_back({id->get<std::string>(), string_or(t, "name", "")});
    }
  }
  return c;
}

std::string ConfigProvider::default_path() {
  std::string base = getenv_or("XDG_CONFIG_HOME", "");
  if (base.empty()) {
    base = (std::filesystem::path(getenv_or("HOME", ".")) / ".config").string();
  }
  return (std::filesystem::path(base) / "hrstream" / "config.json").string();
}

Config ConfigProvider::load() {
  std::lock_guard<std::mutex> lock(mu_);
  cfg_ = Config{};
  doc_ = nlohmann::ordered_json::object();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    fill_json(doc_, cfg_);
    if (save_locked()) {
      ERR << "[info] Created default config " << path_ << " (SQL disabled by default).\n";
    }
    return cfg_;
  }

  std::ifstream in(path_);
  if (!in) {
    ERR << "[warn] Failed to read " << path_ << "; using defaults.\n";
    return cfg_;
  }
  std::stringstream ss;
  ss << in.rdbuf();

  nlohmann::ordered_json doc;
  try {
    doc = nlohmann::ordered_json::parse(ss.str());
  } catch (const nlohmann::json::parse_error& e) {
    ERR << "[warn] Failed to load " << path_ << "; using defaults: " << e.what() << "\n";
    return cfg_;
  }
  if (!doc.is_object()) {
    ERR << "[warn] " << path_ << " is not a JSON object; using defaults.\n";
    return cfg_;
  }

  doc_ = std::move(doc);
  cfg_ = config_from_json(doc_);
  DBG << "[dbg] config: sqlEnabled=" << cfg_.sql_enabled
      << " interval=" << cfg_.write_interval_ms
      << " stale=" << cfg_.stale_threshold_ms
      << " trackers=" << cfg_.trackers.size() << "\n";
  return cfg_;
}

bool ConfigProvider::add_tracker(const std::string& id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  cfg_.trackers.push_back({id, name});
  return save_locked();
}

bool ConfigProvider::save_locked() {
  fill_json(doc_, cfg_);

  std::filesystem::path p(path_);
  std::error_code ec;
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      ERR << "[warn] create_directories failed: " << ec.message() << "\n";
    }
  }

  std::filesystem::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      ERR << "[err] Failed to write " << tmp.string() << "\n";
      return false;
    }
    out << doc_.dump(2) << "\n";
    if (!out.good()) {
      ERR << "[err] Failed to write " << tmp.string() << "\n";
      return false;
    }
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    ERR << "[err] Failed to replace " << path_ << ": " << ec.message() << "\n";
    return false;
  }
  DBG << "[dbg] config saved to " << path_ << "\n";
  return true;
}

} // namespace hrstream
