/**
 * @file notification.cpp
 * @brief Desktop notification delivery for usage alerts.
 *
 * Alerts are handed to notify-send, terminal-notifier, osascript or the
 * BurntToast PowerShell module depending on the platform.
 */
#include "notification.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> notify_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("notify");
  }();
  return logger;
}

/**
 * Quote a string for safe use in POSIX shells.
 *
 * @param s String to escape.
 * @return Safely quoted representation suitable for `sh`/`bash`.
 */
[[maybe_unused]] std::string shell_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Escape characters for use inside AppleScript quoted strings.
[[maybe_unused]] std::string escape_apple_script(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

/// Escape characters for use inside PowerShell single-quoted strings.
[[maybe_unused]] std::string escape_powershell(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\'') {
      out += "''";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

DesktopNotifier::DesktopNotifier(CommandRunner runner)
    : run_(std::move(runner)) {}

bool DesktopNotifier::request_permission() {
#ifdef _WIN32
  return run_("powershell -NoProfile -Command \"if (Get-Module -ListAvailable "
              "-Name BurntToast) { exit 0 } else { exit 1 }\"") == 0;
#elif defined(__APPLE__)
  // osascript ships with the OS
  return true;
#elif defined(__linux__)
  bool available = run_("command -v notify-send >/dev/null 2>&1") == 0;
  if (!available) {
    notify_log()->debug("notify-send not found; desktop alerts disabled");
  }
  return available;
#else
  return false;
#endif
}

void DesktopNotifier::notify(const std::string &title,
                             const std::string &body) {
  int rc = 0;
#ifdef _WIN32
  rc = run_("powershell -NoProfile -Command \"Try {Import-Module BurntToast "
            "-ErrorAction Stop; New-BurntToastNotification -Text '" +
            escape_powershell(title) + "','" + escape_powershell(body) +
            "'} Catch {}\"");
#elif defined(__APPLE__)
  if (run_("command -v terminal-notifier >/dev/null 2>&1") == 0) {
    rc = run_("terminal-notifier -title " + shell_escape(title) +
              " -message " + shell_escape(body));
  } else {
    rc = run_("osascript -e 'display notification \"" +
              escape_apple_script(body) + "\" with title \"" +
              escape_apple_script(title) + "\"'");
  }
#elif defined(__linux__)
  rc = run_("notify-send " + shell_escape(title) + " " + shell_escape(body));
#else
  (void)title;
  (void)body;
#endif
  if (rc != 0) {
    notify_log()->warn("Notification command exited with status {}", rc);
  } else {
    notify_log()->debug("Delivered notification '{}'", title);
  }
}

} // namespace umon
