#include "shared_config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "validation.hpp"

#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

} // namespace

SharedConfig::SharedConfig(CredentialStore *credentials,
                           SettingsStore *settings)
    : credentials_store_(credentials), settings_store_(settings) {}

void SharedConfig::load() {
  AutoRefreshConfig refresh;
  NotificationSettings settings;
  NotificationState state;

  if (credentials_store_) {
    refresh.credentials = credentials_store_->load();
  }
  if (settings_store_) {
    try {
      if (auto j = settings_store_->get(kAutoRefreshKey)) {
        refresh = decode_auto_refresh(*j, refresh);
      }
      if (auto j = settings_store_->get(kNotificationSettingsKey)) {
        settings = decode_notification_settings(*j);
      }
      if (auto j = settings_store_->get(kNotificationStateKey)) {
        state = decode_notification_state(*j);
      }
    } catch (const std::exception &e) {
      config_log()->warn("Falling back to default settings: {}", e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_refresh_ = std::move(refresh);
    notification_settings_ = std::move(settings);
    notification_state_ = std::move(state);
  }
  config_log()->debug("Configuration loaded (credentials {})",
                      is_configured() ? "present" : "absent");
}

void SharedConfig::set_credentials(const std::string &organization_id,
                                   const std::string &session_token) {
  validate_org_id(organization_id);
  validate_session_token(session_token);
  std::lock_guard<std::mutex> writer(write_mutex_);
  Credentials next{organization_id, session_token};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto_refresh_.credentials == next) {
      return;
    }
  }
  if (credentials_store_) {
    credentials_store_->save(next);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_refresh_.credentials = next;
  }
  config_log()->info("Credentials updated for organization {}",
                     organization_id);
  signal_restart();
}

void SharedConfig::clear_credentials() {
  std::lock_guard<std::mutex> writer(write_mutex_);
  if (credentials_store_) {
    credentials_store_->remove();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_refresh_.credentials.reset();
  }
  config_log()->info("Credentials cleared");
  signal_restart();
}

bool SharedConfig::is_configured() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auto_refresh_.has_credentials();
}

void SharedConfig::set_auto_refresh(bool enabled, int interval_minutes) {
  apply_auto_refresh(enabled, interval_minutes, true);
}

void SharedConfig::override_auto_refresh(bool enabled, int interval_minutes) {
  apply_auto_refresh(enabled, interval_minutes, false);
}

void SharedConfig::apply_auto_refresh(bool enabled, int interval_minutes,
                                      bool persist) {
  if (interval_minutes <= 0 || interval_minutes > kMaxIntervalMinutes) {
    throw ValidationError("interval_minutes",
                          "Refresh interval must be between 1 and " +
                              std::to_string(kMaxIntervalMinutes) +
                              " minutes");
  }
  std::lock_guard<std::mutex> writer(write_mutex_);
  AutoRefreshConfig snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto_refresh_.enabled == enabled &&
        auto_refresh_.interval_minutes == interval_minutes) {
      return;
    }
    auto_refresh_.enabled = enabled;
    auto_refresh_.interval_minutes = interval_minutes;
    snapshot = auto_refresh_;
  }
  if (persist) {
    persist_auto_refresh(snapshot);
  }
  config_log()->info("Auto refresh {} every {} minute(s){}",
                     enabled ? "enabled" : "disabled", interval_minutes,
                     persist ? "" : " for this run");
  signal_restart();
}

void SharedConfig::set_notification_settings(
    const NotificationSettings &settings) {
  std::lock_guard<std::mutex> writer(write_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_settings_ = settings;
  }
  if (!settings_store_) {
    return;
  }
  try {
    settings_store_->set(kNotificationSettingsKey, to_json(settings));
  } catch (const StorageError &e) {
    config_log()->warn("Failed to persist notification settings: {}",
                       e.what());
  }
}

void SharedConfig::store_notification_state(const NotificationState &state) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_state_ = state;
  }
  if (!settings_store_) {
    return;
  }
  try {
    settings_store_->set(kNotificationStateKey, to_json(state));
  } catch (const StorageError &e) {
    config_log()->warn("Failed to persist notification state: {}", e.what());
  }
}

void SharedConfig::reset_notification_state() {
  store_notification_state(NotificationState{});
}

AutoRefreshConfig SharedConfig::auto_refresh() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auto_refresh_;
}

NotificationSettings SharedConfig::notification_settings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notification_settings_;
}

NotificationState SharedConfig::notification_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notification_state_;
}

std::size_t SharedConfig::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  std::size_t handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void SharedConfig::unsubscribe(std::size_t handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

std::uint64_t SharedConfig::restart_generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restart_generation_;
}

void SharedConfig::signal_restart() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++restart_generation_;
  }
  // Dispatch under the lock so unsubscribe() waits for a running listener.
  std::lock_guard<std::mutex> lock(listener_mutex_);
  for (const auto &entry : listeners_) {
    entry.second();
  }
}

void SharedConfig::persist_auto_refresh(const AutoRefreshConfig &config) {
  if (!settings_store_) {
    return;
  }
  try {
    settings_store_->set(kAutoRefreshKey, auto_refresh_to_json(config));
  } catch (const StorageError &e) {
    config_log()->warn("Failed to persist auto refresh settings: {}",
                       e.what());
  }
}

} // namespace umon
