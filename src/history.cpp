/**
 * @file history.cpp
 * @brief SQLite storage and export of merge bot outcomes.
 */
#include "history.hpp"
#include "log.hpp"

#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

/// Finalizes a prepared statement when leaving scope.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare statement: ") +
                               sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : "";
}

std::string escape_csv_field(std::string_view field) {
  bool needs_wrap = field.find(',') != std::string_view::npos ||
                    field.find('"') != std::string_view::npos ||
                    field.find('\n') != std::string_view::npos ||
                    field.find('\r') != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size());
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  if (needs_wrap) {
    return std::string("\"") + escaped + "\"";
  }
  return escaped;
}

constexpr const char *kSelectAll =
    "SELECT repo,number,title,merged,attempts,reason FROM merge_outcomes "
    "ORDER BY id";
} // namespace

MergeHistory::MergeHistory(const std::string &db_path) {
  history_log()->debug("History: opening DB {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open database " + db_path + ": " + msg);
  }
  const char *sql = "CREATE TABLE IF NOT EXISTS merge_outcomes("
                    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    "recorded_at TEXT DEFAULT CURRENT_TIMESTAMP,"
                    "repo TEXT, number INTEGER, title TEXT, merged INTEGER,"
                    "attempts INTEGER, reason TEXT);";
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to create table: " + msg);
  }
  history_log()->debug("History: DB initialized");
}

MergeHistory::~MergeHistory() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void MergeHistory::record(const MergeOutcome &outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "INSERT INTO merge_outcomes(repo,number,title,merged,"
                      "attempts,reason) VALUES(?,?,?,?,?,?)");
  sqlite3_bind_text(stmt.get(), 1, outcome.repo_key.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 2, outcome.number);
  sqlite3_bind_text(stmt.get(), 3, outcome.title.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 4, outcome.merged ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 5, outcome.attempts);
  sqlite3_bind_text(stmt.get(), 6, outcome.reason.c_str(), -1,
                    SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("Failed to record outcome: ") +
                             sqlite3_errmsg(db_));
  }
  history_log()->debug("History: recorded {}#{} merged={}", outcome.repo_key,
                       outcome.number, outcome.merged);
}

std::vector<MergeOutcome> MergeHistory::entries() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MergeOutcome> out;
  Statement stmt(db_, kSelectAll);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    MergeOutcome o;
    o.repo_key = column_text(stmt.get(), 0);
    o.number = sqlite3_column_int(stmt.get(), 1);
    o.title = column_text(stmt.get(), 2);
    o.merged = sqlite3_column_int(stmt.get(), 3) != 0;
    o.attempts = sqlite3_column_int(stmt.get(), 4);
    o.reason = column_text(stmt.get(), 5);
    out.push_back(std::move(o));
  }
  return out;
}

void MergeHistory::export_csv(const std::string &path) {
  history_log()->debug("History: export_csv -> {}", path);
  auto rows = entries();
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open CSV file " + path);
  }
  out << "repo,number,title,merged,attempts,reason\n";
  for (const auto &o : rows) {
    out << escape_csv_field(o.repo_key) << ',' << o.number << ','
        << escape_csv_field(o.title) << ',' << (o.merged ? 1 : 0) << ','
        << o.attempts << ',' << escape_csv_field(o.reason) << '\n';
  }
}

void MergeHistory::export_json(const std::string &path) {
  history_log()->debug("History: export_json -> {}", path);
  nlohmann::json j = nlohmann::json::array();
  for (const auto &o : entries()) {
    j.push_back({{"repo", o.repo_key},
                 {"number", o.number},
                 {"title", o.title},
                 {"merged", o.merged},
                 {"attempts", o.attempts},
                 {"reason", o.reason}});
  }
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open JSON file " + path);
  }
  out << j.dump(2);
}

} // namespace prdeck
