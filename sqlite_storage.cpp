#include "sqlite_storage.hpp"

#include "debug.hpp"

namespace hrstream {

namespace {

struct Stmt {
  sqlite3_stmt* stmt{};
  ~Stmt() { if (stmt) sqlite3_finalize(stmt); }
  operator sqlite3_stmt*() const { return stmt; }
};

} // namespace

SqliteStorage::~SqliteStorage() { close(); }

bool SqliteStorage::open(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  if (db_) return true;

  sqlite3* db = nullptr;
  int r = sqlite3_open_v2(path.c_str(), &db,
                          SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                          nullptr);
  if (r != SQLITE_OK) {
    ERR << "[err] Cannot open database " << path << ": "
        << (db ? sqlite3_errmsg(db) : sqlite3_errstr(r)) << "\n";
    sqlite3_close(db);
    return false;
  }
  sqlite3_busy_timeout(db, 1000);
  db_ = db;
  ERR << "[info] SQL enabled. Database: " << path << "\n";
  return true;
}

void SqliteStorage::close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return;
  sqlite3_close(db_);
  db_ = nullptr;
  ensured_.clear();
}

bool SqliteStorage::enabled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return db_ != nullptr;
}

std::string SqliteStorage::table_name_for(std::string_view tracker_id) {
  std::string out = "CODE_";
  for (char c : tracker_id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_';
    if (ok) out += c;
  }
  return out;
}

bool SqliteStorage::exec(const std::string& sql, const std::string& what) {
  char* msg = nullptr;
  int r = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &msg);
  if (r != SQLITE_OK) {
    ERR << "[err] " << what << ": " << (msg ? msg : sqlite3_errstr(r)) << "\n";
    sqlite3_free(msg);
    return false;
  }
  return true;
}

bool SqliteStorage::ensure_table(const std::string& tracker_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return false;

  std::string table = table_name_for(tracker_id);
  if (ensured_.count(table)) return true;

  std::string sql =
    "CREATE TABLE IF NOT EXISTS \"" + table + "\" ("
    "time_text VARCHAR(20) NOT NULL, "
    "heart_rate INTEGER NOT NULL CHECK (heart_rate BETWEEN 0 AND 255))";
  if (!exec(sql, "Error creating table " + table)) return false;

  DBG << "[dbg] ensured table " << table << "\n";
  ensured_.insert(std::move(table));
  return true;
}

bool SqliteStorage::insert_reading(const std::string& tracker_id,
                                   const std::string& time_text,
                                   int heart_rate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return false;

  std::string table = table_name_for(tracker_id);
  std::string sql = "INSERT INTO \"" + table + "\" (time_text, heart_rate) VALUES (?, ?)";

  Stmt st;
  int r = sqlite3_prepare_v2(db_, sql.c_str(), -1, &st.stmt, nullptr);
  if (r != SQLITE_OK) {
    ERR << "[err] Error storing data for " << tracker_id << ": " << sqlite3_errmsg(db_) << "\n";
    return false;
  }
  sqlite3_bind_text(st, 1, time_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(st, 2, heart_rate);

  r = sqlite3_step(st);
  if (r != SQLITE_DONE) {
    ERR << "[err] Error storing data for " << tracker_id << ": " << sqlite3_errmsg(db_) << "\n";
    return false;
  }
  return true;
}

long long SqliteStorage::row_count(const std::string& tracker_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return -1;

  std::string sql = "SELECT COUNT(*) FROM \"" + table_name_for(tracker_id) + "\"";
  Stmt st;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st.stmt, nullptr) != SQLITE_OK) return -1;
  if (sqlite3_step(st) != SQLITE_ROW) return -1;
  return sqlite3_column_int64(st, 0);
}

} // namespace hrstream
