/**
 * @file history.hpp
 * @brief Usage history database for usagemonitor.
 *
 * Declares the snapshot store interface and its SQLite implementation with
 * range presets, trend statistics and CSV/JSON export.
 */

#ifndef USAGEMONITOR_HISTORY_HPP
#define USAGEMONITOR_HISTORY_HPP

#include "usage_types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace umon {

/// One stored snapshot.
struct UsageHistoryRecord {
  std::int64_t id{0};
  std::string timestamp; ///< RFC 3339 UTC
  UsageSnapshot snapshot;

  /// Flat JSON object with one utilization/resets_at pair per dimension.
  nlohmann::json to_json() const;
};

/// Trend of one dimension over a range.
struct MetricStats {
  std::optional<double> current;  ///< Last value in range
  std::optional<double> change;   ///< Last minus first
  std::optional<double> velocity; ///< Points per hour, only for growth
};

/**
 * Compute a dimension trend from the first and last value in a range.
 *
 * @param first Earliest value, if recorded.
 * @param last Latest value, if recorded.
 * @param period_hours Length of the range.
 */
MetricStats compute_metric_stats(std::optional<double> first,
                                 std::optional<double> last,
                                 double period_hours);

/// Trends for every dimension over a range.
struct UsageStats {
  std::array<MetricStats, 4> metrics{};
  std::int64_t record_count{0};
  double period_hours{0.0};

  const MetricStats &metric(UsageDimension dim) const {
    return metrics[dimension_index(dim)];
  }
};

/**
 * Hours covered by a range preset: `1h`, `6h`, `24h`, `7d` or `30d`.
 * Unknown presets select 24 hours.
 */
double range_hours(const std::string &range);

/**
 * Append/query/prune storage for usage snapshots.
 */
class SnapshotStore {
public:
  virtual ~SnapshotStore() = default;

  /**
   * Record @p snapshot as observed at @p timestamp.
   *
   * @throws StorageError When the record cannot be written.
   */
  virtual void append(const UsageSnapshot &snapshot,
                      std::chrono::system_clock::time_point timestamp) = 0;

  /// Records with `from <= timestamp <= to`, oldest first.
  virtual std::vector<UsageHistoryRecord>
  query_range(std::chrono::system_clock::time_point from,
              std::chrono::system_clock::time_point to) const = 0;

  /**
   * Delete records older than @p older_than.
   *
   * @return Number of deleted records.
   */
  virtual std::size_t prune(std::chrono::system_clock::time_point older_than) = 0;
};

/**
 * RAII wrapper around a prepared SQLite statement.
 */
class Statement {
public:
  /**
   * Prepare @p sql on @p db.
   *
   * @throws StorageError When preparation fails.
   */
  Statement(sqlite3 *db, const char *sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

  void bind_text(int index, const std::string &value);
  void bind_optional_text(int index, const std::optional<std::string> &value);
  void bind_optional_double(int index, std::optional<double> value);

  /**
   * Advance the statement.
   *
   * @return `true` when a row is available, `false` when done.
   * @throws StorageError On execution errors.
   */
  bool step();

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

/**
 * SQLite-backed snapshot history.
 */
class UsageHistory : public SnapshotStore {
public:
  /**
   * Open or create the database at @p db_path and apply the schema.
   *
   * @param db_path Database file, or `:memory:`.
   * @throws StorageError When the database cannot be opened or migrated.
   */
  explicit UsageHistory(const std::string &db_path);
  ~UsageHistory() override;
  UsageHistory(const UsageHistory &) = delete;
  UsageHistory &operator=(const UsageHistory &) = delete;

  void append(const UsageSnapshot &snapshot,
              std::chrono::system_clock::time_point timestamp) override;

  std::vector<UsageHistoryRecord>
  query_range(std::chrono::system_clock::time_point from,
              std::chrono::system_clock::time_point to) const override;

  std::size_t prune(std::chrono::system_clock::time_point older_than) override;

  /// Records of the last @ref range_hours(range) hours before @p now.
  std::vector<UsageHistoryRecord>
  query_preset(const std::string &range,
               std::chrono::system_clock::time_point now) const;

  /// Trend statistics for a range preset ending at @p now.
  UsageStats stats(const std::string &range,
                   std::chrono::system_clock::time_point now) const;

  /**
   * Export every record to a CSV file.
   *
   * @throws StorageError On I/O or query failures.
   */
  void export_csv(const std::string &path) const;

  /**
   * Export every record to a JSON array file.
   *
   * @throws StorageError On I/O or query failures.
   */
  void export_json(const std::string &path) const;

private:
  std::vector<UsageHistoryRecord> select_locked(const char *sql,
                                                const std::string *from,
                                                const std::string *to) const;

  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace umon

#endif // USAGEMONITOR_HISTORY_HPP
