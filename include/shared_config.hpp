/**
 * @file shared_config.hpp
 * @brief Process-wide configuration shared by the CLI and the supervisor.
 *
 * Holds credentials, the auto-refresh schedule and the notification
 * settings/state behind one mutex, persists changes through the configured
 * stores and signals subscribers when the refresh schedule must restart.
 */

#ifndef USAGEMONITOR_SHARED_CONFIG_HPP
#define USAGEMONITOR_SHARED_CONFIG_HPP

#include "credential_store.hpp"
#include "notification_rules.hpp"
#include "refresh_config.hpp"
#include "settings_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace umon {

class SharedConfig {
public:
  using Listener = std::function<void()>;

  /**
   * @param credentials Credential persistence, may be null.
   * @param settings Settings persistence, may be null.
   */
  SharedConfig(CredentialStore *credentials = nullptr,
               SettingsStore *settings = nullptr);

  /**
   * Populate the in-memory values from the stores. Missing or malformed
   * records fall back to defaults; never throws for bad data.
   */
  void load();

  /**
   * Replace the credentials.
   *
   * Identical credentials are a no-op. Otherwise the credentials are
   * persisted first and applied only when persistence succeeds; listeners
   * are then notified.
   *
   * @throws ValidationError When either value is malformed.
   * @throws StorageError When the credential store rejects the write.
   */
  void set_credentials(const std::string &organization_id,
                       const std::string &session_token);

  /**
   * Forget the stored credentials and notify listeners.
   *
   * @throws StorageError When the credential record cannot be removed.
   */
  void clear_credentials();

  /// Whether credentials are present.
  bool is_configured() const;

  /**
   * Update the refresh schedule. Identical values are a no-op; otherwise
   * listeners are notified. Persistence failures are logged.
   *
   * @throws ValidationError When @p interval_minutes is outside
   *         [1, kMaxIntervalMinutes].
   */
  void set_auto_refresh(bool enabled, int interval_minutes);

  /**
   * Apply a refresh schedule for this process only. Behaves like
   * set_auto_refresh() but leaves the settings document untouched.
   *
   * @throws ValidationError When @p interval_minutes is outside
   *         [1, kMaxIntervalMinutes].
   */
  void override_auto_refresh(bool enabled, int interval_minutes);

  /**
   * Replace notification settings. Takes effect at the next evaluation and
   * does not notify listeners.
   */
  void set_notification_settings(const NotificationSettings &settings);

  /// Persist the notifier state produced by an evaluation.
  void store_notification_state(const NotificationState &state);

  /// Reset the notifier state to its defaults.
  void reset_notification_state();

  AutoRefreshConfig auto_refresh() const;
  NotificationSettings notification_settings() const;
  NotificationState notification_state() const;

  /**
   * Register @p listener to run after every change requiring a restart of
   * the refresh schedule. Listeners run on the writer's thread with the
   * listener list locked, so they must neither mutate the configuration
   * nor subscribe or unsubscribe.
   *
   * @return Handle for unsubscribe().
   */
  std::size_t subscribe(Listener listener);

  /// Remove a listener. Blocks while a dispatch is running it.
  void unsubscribe(std::size_t handle);

  /// Number of restart signals emitted so far.
  std::uint64_t restart_generation() const;

private:
  void apply_auto_refresh(bool enabled, int interval_minutes, bool persist);
  void signal_restart();
  void persist_auto_refresh(const AutoRefreshConfig &config);

  CredentialStore *credentials_store_;
  SettingsStore *settings_store_;

  // Serializes mutating operations, including their persistence.
  std::mutex write_mutex_;
  mutable std::mutex mutex_;
  AutoRefreshConfig auto_refresh_;
  NotificationSettings notification_settings_;
  NotificationState notification_state_;
  std::uint64_t restart_generation_{0};

  mutable std::mutex listener_mutex_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_{1};
};

} // namespace umon

#endif // USAGEMONITOR_SHARED_CONFIG_HPP
