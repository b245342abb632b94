#include "settings_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "refresh_config.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> settings_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("settings");
  }();
  return logger;
}

bool read_bool(const nlohmann::json &j, const char *key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

int read_positive_int(const nlohmann::json &j, const char *key, int fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return fallback;
  }
  auto value = it->get<long long>();
  if (value <= 0 || value > kMaxIntervalMinutes) {
    return fallback;
  }
  return static_cast<int>(value);
}

double read_number(const nlohmann::json &j, const char *key, double fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<double>();
}

/**
 * Read an integer set whose members must lie in [@p min, @p max].
 * Any invalid member discards the whole field.
 */
std::set<int> read_int_set(const nlohmann::json &j, const char *key, int min,
                           int max, const std::set<int> &fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return fallback;
  }
  std::set<int> values;
  for (const auto &item : *it) {
    if (!item.is_number_integer()) {
      return fallback;
    }
    auto value = item.get<long long>();
    if (value < min || value > max) {
      return fallback;
    }
    values.insert(static_cast<int>(value));
  }
  return values;
}

std::set<std::string> read_string_set(const nlohmann::json &j,
                                      const char *key) {
  std::set<std::string> values;
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return values;
  }
  for (const auto &item : *it) {
    if (item.is_string()) {
      values.insert(item.get<std::string>());
    }
  }
  return values;
}

nlohmann::json rule_to_json(const NotificationRule &rule) {
  return {{"interval_enabled", rule.interval_enabled},
          {"interval_percent", rule.interval_percent},
          {"threshold_enabled", rule.threshold_enabled},
          {"thresholds", rule.thresholds},
          {"time_remaining_enabled", rule.time_remaining_enabled},
          {"time_remaining_minutes", rule.time_remaining_minutes}};
}

NotificationRule decode_rule(const nlohmann::json &j) {
  NotificationRule rule;
  if (!j.is_object()) {
    return rule;
  }
  const NotificationRule defaults;
  rule.interval_enabled =
      read_bool(j, "interval_enabled", defaults.interval_enabled);
  rule.interval_percent =
      read_positive_int(j, "interval_percent", defaults.interval_percent);
  if (rule.interval_percent > 100) {
    rule.interval_percent = defaults.interval_percent;
  }
  rule.threshold_enabled =
      read_bool(j, "threshold_enabled", defaults.threshold_enabled);
  rule.thresholds = read_int_set(j, "thresholds", 0, 100, defaults.thresholds);
  rule.time_remaining_enabled =
      read_bool(j, "time_remaining_enabled", defaults.time_remaining_enabled);
  rule.time_remaining_minutes =
      read_int_set(j, "time_remaining_minutes", 1, 100000,
                   defaults.time_remaining_minutes);
  return rule;
}

std::string last_key(UsageDimension dim) {
  return std::string(dimension_key(dim)) + "_last";
}

} // namespace

JsonFileSettingsStore::JsonFileSettingsStore(std::string path)
    : path_(std::move(path)), document_(nlohmann::json::object()) {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    settings_log()->debug("Settings file {} not found; starting empty", path_);
    return;
  }
  std::ifstream in(path_);
  if (!in) {
    settings_log()->warn("Failed to open settings file {}; starting empty",
                         path_);
    return;
  }
  try {
    nlohmann::json parsed;
    in >> parsed;
    if (parsed.is_object()) {
      document_ = std::move(parsed);
    } else {
      settings_log()->warn("Settings file {} is not an object; ignoring",
                           path_);
    }
  } catch (const nlohmann::json::exception &e) {
    settings_log()->warn("Settings file {} is corrupt ({}); ignoring", path_,
                         e.what());
  }
}

std::optional<nlohmann::json>
JsonFileSettingsStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = document_.find(key);
  if (it == document_.end()) {
    return std::nullopt;
  }
  return *it;
}

void JsonFileSettingsStore::set(const std::string &key,
                                const nlohmann::json &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous = document_;
  document_[key] = value;
  try {
    write_locked();
  } catch (const StorageError &) {
    document_ = std::move(previous);
    throw;
  }
}

void JsonFileSettingsStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  document_ = nlohmann::json::object();
  write_locked();
}

/**
 * Rewrite the document through a temporary file and rename it into place.
 *
 * @throws StorageError When any step fails.
 */
void JsonFileSettingsStore::write_locked() {
  namespace fs = std::filesystem;
  fs::path path(path_);
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw StorageError("Failed to create settings directory: " +
                         ec.message());
    }
  }
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out) {
      throw StorageError("Failed to open " + tmp.string() + " for writing");
    }
    out << document_.dump(2) << '\n';
    out.close();
    if (!out) {
      fs::remove(tmp, ec);
      throw StorageError("Failed to write " + tmp.string());
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw StorageError("Failed to replace settings file: " + ec.message());
  }
  settings_log()->debug("Settings written to {}", path_);
}

std::optional<nlohmann::json>
MemorySettingsStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = document_.find(key);
  if (it == document_.end()) {
    return std::nullopt;
  }
  return *it;
}

void MemorySettingsStore::set(const std::string &key,
                              const nlohmann::json &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  document_[key] = value;
}

void MemorySettingsStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  document_ = nlohmann::json::object();
}

nlohmann::json to_json(const NotificationSettings &settings) {
  nlohmann::json j;
  j["enabled"] = settings.enabled;
  for (auto dim : kAllDimensions) {
    j[dimension_key(dim)] = rule_to_json(settings.rule(dim));
  }
  return j;
}

nlohmann::json to_json(const NotificationState &state) {
  nlohmann::json j;
  for (auto dim : kAllDimensions) {
    j[last_key(dim)] = state.last(dim);
  }
  j["fired_thresholds"] = state.fired_thresholds;
  j["fired_time_remaining"] = state.fired_time_remaining;
  return j;
}

nlohmann::json auto_refresh_to_json(const AutoRefreshConfig &config) {
  return {{"enabled", config.enabled},
          {"intervalMinutes", config.interval_minutes}};
}

NotificationSettings decode_notification_settings(const nlohmann::json &j) {
  NotificationSettings settings;
  if (!j.is_object()) {
    return settings;
  }
  settings.enabled = read_bool(j, "enabled", settings.enabled);
  for (auto dim : kAllDimensions) {
    auto it = j.find(dimension_key(dim));
    if (it != j.end()) {
      settings.rule(dim) = decode_rule(*it);
    }
  }
  return settings;
}

NotificationState decode_notification_state(const nlohmann::json &j) {
  NotificationState state;
  if (!j.is_object()) {
    return state;
  }
  for (auto dim : kAllDimensions) {
    const std::string key = last_key(dim);
    state.set_last(dim, read_number(j, key.c_str(), 0.0));
  }
  state.fired_thresholds = read_string_set(j, "fired_thresholds");
  state.fired_time_remaining = read_string_set(j, "fired_time_remaining");
  return state;
}

AutoRefreshConfig decode_auto_refresh(const nlohmann::json &j,
                                      AutoRefreshConfig base) {
  if (!j.is_object()) {
    return base;
  }
  base.enabled = read_bool(j, "enabled", base.enabled);
  base.interval_minutes =
      read_positive_int(j, "intervalMinutes", base.interval_minutes);
  return base;
}

} // namespace umon
