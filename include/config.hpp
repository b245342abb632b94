#ifndef USAGEMONITOR_CONFIG_HPP
#define USAGEMONITOR_CONFIG_HPP

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace umon {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Minutes between scheduled fetches.
  int interval_minutes() const { return interval_minutes_; }

  /**
   * Set the refresh interval.
   *
   * @throws ValidationError When @p minutes is not positive.
   */
  void set_interval_minutes(int minutes);

  /// Whether scheduled fetches are enabled.
  bool auto_refresh() const { return auto_refresh_; }

  /// Enable or disable scheduled fetches.
  void set_auto_refresh(bool enabled) { auto_refresh_ = enabled; }

  /// Align scheduled fetches shortly after the top of the hour.
  bool hourly_refresh() const { return hourly_refresh_; }

  /// Set hourly alignment.
  void set_hourly_refresh(bool enabled) { hourly_refresh_ = enabled; }

  /// Delay after the first rate-limited response, in seconds.
  int backoff_initial_seconds() const { return backoff_initial_seconds_; }

  /// Set initial backoff delay (minimum 1).
  void set_backoff_initial_seconds(int s) {
    backoff_initial_seconds_ = s < 1 ? 1 : s;
  }

  /// Upper bound for backoff delays, in seconds.
  int backoff_max_seconds() const { return backoff_max_seconds_; }

  /// Set maximum backoff delay (minimum 1).
  void set_backoff_max_seconds(int s) { backoff_max_seconds_ = s < 1 ? 1 : s; }

  /// Scheme and host of the usage API.
  const std::string &api_base() const { return api_base_; }

  /// Set the usage API base URL.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// User-Agent sent to the usage API; empty selects the default.
  const std::string &user_agent() const { return user_agent_; }

  /// Set User-Agent.
  void set_user_agent(const std::string &ua) { user_agent_ = ua; }

  /// Path of the settings document; empty selects the default.
  const std::string &settings_file() const { return settings_file_; }

  void set_settings_file(const std::string &path) { settings_file_ = path; }

  /// Path of the credential file; empty selects the default.
  const std::string &credentials_file() const { return credentials_file_; }

  void set_credentials_file(const std::string &path) {
    credentials_file_ = path;
  }

  /// Path of the history database; empty selects the default.
  const std::string &history_db() const { return history_db_; }

  void set_history_db(const std::string &path) { history_db_ = path; }

  /// Days of history to keep (0 disables pruning).
  int history_retention_days() const { return history_retention_days_; }

  /// Set history retention (negative values clamp to 0).
  void set_history_retention_days(int days) {
    history_retention_days_ = days < 0 ? 0 : days;
  }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain.
  int log_rotate() const { return log_rotate_; }

  /// Set rotated log retention (negative values clamp to 0).
  void set_log_rotate(int files) { log_rotate_ = files < 0 ? 0 : files; }

  /// Whether rotated logs are gzip-compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable rotated log compression.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> c) {
    log_categories_ = std::move(c);
  }

  /// Whether desktop notifications are delivered.
  bool desktop_notifications() const { return desktop_notifications_; }

  /// Enable or disable desktop notifications.
  void set_desktop_notifications(bool enabled) {
    desktop_notifications_ = enabled;
  }

  /// Populate fields from a JSON object.
  void load_json(const nlohmann::json &j);

  /// Create a Config from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a YAML, TOML or JSON file.
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

private:
  int interval_minutes_ = 5;
  bool auto_refresh_ = true;
  bool hourly_refresh_ = false;
  int backoff_initial_seconds_ = 30;
  int backoff_max_seconds_ = 300;
  std::string api_base_ = "https://claude.ai";
  int http_timeout_ = 30;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string user_agent_;
  std::string settings_file_;
  std::string credentials_file_;
  std::string history_db_;
  int history_retention_days_ = 30;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  bool desktop_notifications_ = true;
};

/**
 * Directory holding usagemonitor's data files:
 * `$XDG_CONFIG_HOME/usagemonitor`, `$HOME/.config/usagemonitor`, or
 * `%APPDATA%\usagemonitor` on Windows. Falls back to the working directory.
 */
std::string default_data_dir();

} // namespace umon

#endif // USAGEMONITOR_CONFIG_HPP
