/**
 * @file refresh_config.hpp
 * @brief Credentials and auto-refresh preferences.
 */

#ifndef USAGEMONITOR_REFRESH_CONFIG_HPP
#define USAGEMONITOR_REFRESH_CONFIG_HPP

#include <optional>
#include <string>

namespace umon {

/// Largest accepted refresh interval, roughly two years.
constexpr int kMaxIntervalMinutes = 1000000;

/// Organization id and session token, always stored together.
struct Credentials {
  std::string organization_id;
  std::string session_token;

  bool operator==(const Credentials &other) const {
    return organization_id == other.organization_id &&
           session_token == other.session_token;
  }
  bool operator!=(const Credentials &other) const { return !(*this == other); }
};

/// Everything the refresh supervisor reads at the top of each iteration.
struct AutoRefreshConfig {
  std::optional<Credentials> credentials;
  int interval_minutes{5};
  bool enabled{true};

  bool has_credentials() const { return credentials.has_value(); }

  bool operator==(const AutoRefreshConfig &other) const {
    return credentials == other.credentials &&
           interval_minutes == other.interval_minutes &&
           enabled == other.enabled;
  }
  bool operator!=(const AutoRefreshConfig &other) const {
    return !(*this == other);
  }
};

} // namespace umon

#endif // USAGEMONITOR_REFRESH_CONFIG_HPP
