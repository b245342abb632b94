/**
 * @file settings_store.hpp
 * @brief Key/value persistence for preferences and notification state.
 *
 * Values are JSON documents. Typed decoders validate each field separately
 * and substitute the default for anything missing or malformed.
 */

#ifndef USAGEMONITOR_SETTINGS_STORE_HPP
#define USAGEMONITOR_SETTINGS_STORE_HPP

#include "notification_rules.hpp"
#include "refresh_config.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace umon {

/// Settings document keys.
constexpr const char *kAutoRefreshKey = "autoRefresh";
constexpr const char *kNotificationSettingsKey = "notificationSettings";
constexpr const char *kNotificationStateKey = "notificationState";

/**
 * Loosely typed settings persistence.
 */
class SettingsStore {
public:
  virtual ~SettingsStore() = default;

  /// Stored value for @p key, if any.
  virtual std::optional<nlohmann::json> get(const std::string &key) const = 0;

  /**
   * Store @p value under @p key.
   *
   * @throws StorageError When the value cannot be persisted.
   */
  virtual void set(const std::string &key, const nlohmann::json &value) = 0;

  /**
   * Remove every stored value.
   *
   * @throws StorageError When the backing store cannot be cleared.
   */
  virtual void clear() = 0;
};

/**
 * Settings kept in one JSON document on disk.
 *
 * Each write replaces the file atomically through a temporary sibling.
 */
class JsonFileSettingsStore : public SettingsStore {
public:
  /**
   * Open the document at @p path. A missing file starts empty; a corrupt
   * file is logged and treated as empty.
   */
  explicit JsonFileSettingsStore(std::string path);

  std::optional<nlohmann::json> get(const std::string &key) const override;
  void set(const std::string &key, const nlohmann::json &value) override;
  void clear() override;

private:
  void write_locked();

  std::string path_;
  mutable std::mutex mutex_;
  nlohmann::json document_;
};

/// In-process settings store for embedding and tests.
class MemorySettingsStore : public SettingsStore {
public:
  std::optional<nlohmann::json> get(const std::string &key) const override;
  void set(const std::string &key, const nlohmann::json &value) override;
  void clear() override;

private:
  mutable std::mutex mutex_;
  nlohmann::json document_ = nlohmann::json::object();
};

/// Encode notification preferences.
nlohmann::json to_json(const NotificationSettings &settings);

/// Encode notification state.
nlohmann::json to_json(const NotificationState &state);

/// Encode the persisted part of the auto-refresh configuration.
nlohmann::json auto_refresh_to_json(const AutoRefreshConfig &config);

/// Decode notification preferences with field-level fallback to defaults.
NotificationSettings decode_notification_settings(const nlohmann::json &j);

/// Decode notification state with field-level fallback to defaults.
NotificationState decode_notification_state(const nlohmann::json &j);

/**
 * Apply persisted `enabled` and `intervalMinutes` onto @p base.
 *
 * Credentials are never read from the settings document.
 */
AutoRefreshConfig decode_auto_refresh(const nlohmann::json &j,
                                      AutoRefreshConfig base);

} // namespace umon

#endif // USAGEMONITOR_SETTINGS_STORE_HPP
