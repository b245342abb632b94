/**
 * @file history.cpp
 * @brief Implements persistent storage and export of usage snapshots using
 * SQLite.
 *
 * Each successful fetch is stored as one row holding the utilization and
 * reset time of all four dimensions. Rows can be queried by range, pruned
 * by age, summarised as trends and exported to CSV or JSON.
 */
#include "history.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/time.hpp"

#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

const char *kSchema = "CREATE TABLE IF NOT EXISTS usage_history("
                      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      "timestamp TEXT NOT NULL,"
                      "five_hour_utilization REAL, five_hour_resets_at TEXT,"
                      "seven_day_utilization REAL, seven_day_resets_at TEXT,"
                      "sonnet_utilization REAL, sonnet_resets_at TEXT,"
                      "opus_utilization REAL, opus_resets_at TEXT);"
                      "CREATE INDEX IF NOT EXISTS idx_timestamp "
                      "ON usage_history(timestamp);";

const char *kSelectColumns =
    "SELECT id, timestamp, five_hour_utilization, five_hour_resets_at,"
    " seven_day_utilization, seven_day_resets_at,"
    " sonnet_utilization, sonnet_resets_at,"
    " opus_utilization, opus_resets_at FROM usage_history";

/// Column prefix of a dimension in the history table.
const char *column_prefix(UsageDimension dim) {
  switch (dim) {
  case UsageDimension::FiveHour:
    return "five_hour";
  case UsageDimension::SevenDay:
    return "seven_day";
  case UsageDimension::SevenDaySonnet:
    return "sonnet";
  case UsageDimension::SevenDayOpus:
    return "opus";
  }
  return "unknown";
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return std::string(text ? reinterpret_cast<const char *>(text) : "");
}

UsageHistoryRecord read_record(sqlite3_stmt *stmt) {
  UsageHistoryRecord record;
  record.id = sqlite3_column_int64(stmt, 0);
  record.timestamp = column_text(stmt, 1).value_or("");
  std::array<std::optional<UsagePeriod>, 4> periods;
  for (auto dim : kAllDimensions) {
    int col = 2 + 2 * static_cast<int>(dimension_index(dim));
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
      continue;
    }
    periods[dimension_index(dim)] =
        UsagePeriod{sqlite3_column_double(stmt, col), column_text(stmt, col + 1)};
  }
  record.snapshot =
      UsageSnapshot(periods[0], periods[1], periods[2], periods[3]);
  return record;
}

std::string escape_csv_field(std::string_view field) {
  bool needs_wrap = field.find_first_of(",\"\n\r") != std::string_view::npos;
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
    return "\"" + escaped + "\"";
  }
  return escaped;
}

} // namespace

nlohmann::json UsageHistoryRecord::to_json() const {
  nlohmann::json j;
  j["id"] = id;
  j["timestamp"] = timestamp;
  for (auto dim : kAllDimensions) {
    const std::string prefix = column_prefix(dim);
    const auto &period = snapshot.period(dim);
    if (period) {
      j[prefix + "_utilization"] = period->utilization;
    } else {
      j[prefix + "_utilization"] = nullptr;
    }
    if (period && period->resets_at) {
      j[prefix + "_resets_at"] = *period->resets_at;
    } else {
      j[prefix + "_resets_at"] = nullptr;
    }
  }
  return j;
}

MetricStats compute_metric_stats(std::optional<double> first,
                                 std::optional<double> last,
                                 double period_hours) {
  MetricStats stats;
  stats.current = last;
  if (first && last) {
    stats.change = *last - *first;
    if (*stats.change >= 0.0 && period_hours > 0.0) {
      stats.velocity = *stats.change / period_hours;
    }
  }
  return stats;
}

double range_hours(const std::string &range) {
  if (range == "1h") {
    return 1.0;
  }
  if (range == "6h") {
    return 6.0;
  }
  if (range == "7d") {
    return 7.0 * 24.0;
  }
  if (range == "30d") {
    return 30.0 * 24.0;
  }
  return 24.0;
}

Statement::Statement(sqlite3 *db, const char *sql) : db_(db) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    throw StorageError(std::string("Failed to prepare statement: ") +
                       sqlite3_errmsg(db));
  }
}

Statement::~Statement() { sqlite3_finalize(stmt_); }

void Statement::bind_text(int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind_optional_text(int index,
                                   const std::optional<std::string> &value) {
  if (value) {
    bind_text(index, *value);
  } else {
    sqlite3_bind_null(stmt_, index);
  }
}

void Statement::bind_optional_double(int index, std::optional<double> value) {
  if (value) {
    sqlite3_bind_double(stmt_, index, *value);
  } else {
    sqlite3_bind_null(stmt_, index);
  }
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw StorageError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
}

/**
 * Open the history database and apply the schema.
 *
 * @param db_path Path to the SQLite database file to open or create.
 * @throws StorageError When the database cannot be opened or the schema
 *         initialization fails.
 */
UsageHistory::UsageHistory(const std::string &db_path) {
  history_log()->debug("Opening history DB {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError("Failed to open history database: " + msg);
  }
  char *err = nullptr;
  if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError("Failed to create history schema: " + msg);
  }
}

UsageHistory::~UsageHistory() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void UsageHistory::append(const UsageSnapshot &snapshot,
                          std::chrono::system_clock::time_point timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "INSERT INTO usage_history(timestamp,"
                      " five_hour_utilization, five_hour_resets_at,"
                      " seven_day_utilization, seven_day_resets_at,"
                      " sonnet_utilization, sonnet_resets_at,"
                      " opus_utilization, opus_resets_at)"
                      " VALUES(?,?,?,?,?,?,?,?,?)");
  stmt.bind_text(1, format_rfc3339(timestamp));
  for (auto dim : kAllDimensions) {
    int index = 2 + 2 * static_cast<int>(dimension_index(dim));
    const auto &period = snapshot.period(dim);
    stmt.bind_optional_double(
        index, period ? std::optional<double>(period->utilization)
                      : std::nullopt);
    stmt.bind_optional_text(index + 1,
                            period ? period->resets_at : std::nullopt);
  }
  stmt.step();
}

std::vector<UsageHistoryRecord>
UsageHistory::select_locked(const char *sql, const std::string *from,
                            const std::string *to) const {
  Statement stmt(db_, sql);
  if (from) {
    stmt.bind_text(1, *from);
  }
  if (to) {
    stmt.bind_text(2, *to);
  }
  std::vector<UsageHistoryRecord> records;
  while (stmt.step()) {
    records.push_back(read_record(stmt.get()));
  }
  return records;
}

std::vector<UsageHistoryRecord>
UsageHistory::query_range(std::chrono::system_clock::time_point from,
                          std::chrono::system_clock::time_point to) const {
  const std::string from_str = format_rfc3339(from);
  const std::string to_str = format_rfc3339(to);
  const std::string sql = std::string(kSelectColumns) +
                          " WHERE timestamp >= ?1 AND timestamp <= ?2"
                          " ORDER BY timestamp ASC, id ASC";
  std::lock_guard<std::mutex> lock(mutex_);
  return select_locked(sql.c_str(), &from_str, &to_str);
}

std::size_t
UsageHistory::prune(std::chrono::system_clock::time_point older_than) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "DELETE FROM usage_history WHERE timestamp < ?1");
  stmt.bind_text(1, format_rfc3339(older_than));
  stmt.step();
  auto deleted = static_cast<std::size_t>(sqlite3_changes(db_));
  history_log()->info("Pruned {} history record(s)", deleted);
  return deleted;
}

std::vector<UsageHistoryRecord>
UsageHistory::query_preset(const std::string &range,
                           std::chrono::system_clock::time_point now) const {
  auto span = std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::duration<double, std::ratio<3600>>(range_hours(range)));
  return query_range(now - span, now);
}

UsageStats UsageHistory::stats(const std::string &range,
                               std::chrono::system_clock::time_point now) const {
  UsageStats stats;
  stats.period_hours = range_hours(range);
  auto records = query_preset(range, now);
  stats.record_count = static_cast<std::int64_t>(records.size());
  for (auto dim : kAllDimensions) {
    std::optional<double> first;
    std::optional<double> last;
    if (!records.empty()) {
      if (const auto &p = records.front().snapshot.period(dim)) {
        first = p->utilization;
      }
      if (const auto &p = records.back().snapshot.period(dim)) {
        last = p->utilization;
      }
    }
    stats.metrics[dimension_index(dim)] =
        compute_metric_stats(first, last, stats.period_hours);
  }
  return stats;
}

/**
 * Export history entries to a CSV file.
 *
 * @param path Destination file path for the CSV export.
 * @throws StorageError On database query errors or I/O failures.
 */
void UsageHistory::export_csv(const std::string &path) const {
  history_log()->debug("export_csv -> {}", path);
  std::vector<UsageHistoryRecord> records;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string(kSelectColumns) + " ORDER BY id ASC";
    records = select_locked(sql.c_str(), nullptr, nullptr);
  }
  std::ofstream out(path);
  if (!out) {
    throw StorageError("Failed to open CSV file " + path);
  }
  out << "id,timestamp";
  for (auto dim : kAllDimensions) {
    out << ',' << column_prefix(dim) << "_utilization," << column_prefix(dim)
        << "_resets_at";
  }
  out << '\n';
  for (const auto &record : records) {
    out << record.id << ',' << escape_csv_field(record.timestamp);
    for (auto dim : kAllDimensions) {
      const auto &period = record.snapshot.period(dim);
      out << ',';
      if (period) {
        out << period->utilization;
      }
      out << ',';
      if (period && period->resets_at) {
        out << escape_csv_field(*period->resets_at);
      }
    }
    out << '\n';
  }
  if (!out) {
    throw StorageError("Failed to write CSV file " + path);
  }
}

/**
 * Export history entries to a JSON file.
 *
 * @param path Destination file path for the JSON export.
 * @throws StorageError On database query errors or I/O failures.
 */
void UsageHistory::export_json(const std::string &path) const {
  history_log()->debug("export_json -> {}", path);
  std::vector<UsageHistoryRecord> records;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string(kSelectColumns) + " ORDER BY id ASC";
    records = select_locked(sql.c_str(), nullptr, nullptr);
  }
  nlohmann::json j = nlohmann::json::array();
  for (const auto &record : records) {
    j.push_back(record.to_json());
  }
  std::ofstream out(path);
  if (!out) {
    throw StorageError("Failed to open JSON file " + path);
  }
  out << j.dump(2);
  if (!out) {
    throw StorageError("Failed to write JSON file " + path);
  }
}

} // namespace umon
