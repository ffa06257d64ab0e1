#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

#include <sqlite3.h>

#include "sinks.hpp"

namespace hrstream {

// One append-only table per tracker ("CODE_<sanitized id>") in a single
// SQLite database file.
class SqliteStorage : public StorageSink {
public:
  SqliteStorage() = default;
  ~SqliteStorage() override;
  SqliteStorage(const SqliteStorage&) = delete;
  SqliteStorage& operator=(const SqliteStorage&) = delete;

  // ":memory:" is accepted. Returns false (and logs) on failure, leaving the
  // sink disabled.
  bool open(const std::string& path);
  void close();

  bool enabled() const override;
  bool ensure_table(const std::string& tracker_id) override;
  bool insert_reading(const std::string& tracker_id,
                      const std::string& time_text,
                      int heart_rate) override;

  // Keeps [A-Za-z0-9_] only.
  static std::string table_name_for(std::string_view tracker_id);

  // Rows in a tracker's table, or -1 if the table cannot be read.
  long long row_count(const std::string& tracker_id);

private:
  bool exec(const std::string& sql, const std::string& what);

  mutable std::mutex mu_;
  sqlite3* db_{nullptr};
  std::unordered_set<std::string> ensured_;
};

} // namespace hrstream
