#include "cli.hpp"
#include "log.hpp"
#include "refresh_config.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace umon {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 12> categories = {
      "app",     "cli",      "config",  "credentials", "evaluator",
      "fetcher", "history",  "http",    "logging",     "notify",
      "settings", "supervisor"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "supervisor=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

/**
 * Fetch an environment variable in a cross-platform, secure manner.
 *
 * @param name Null-terminated environment variable name.
 * @return Variable contents or an empty string if unavailable.
 */
std::string get_env_var(const char *name) {
#ifdef _WIN32
  char *buf = nullptr;
  size_t sz = 0;
  if (_dupenv_s(&buf, &sz, name) == 0 && buf) {
    std::string value(buf);
    std::free(buf);
    return value;
  }
  return {};
#else
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
#endif
}
} // namespace

/**
 * Parse command line arguments.
 *
 * `--log-compress` and `--no-log-compress` are consumed before CLI11 sees
 * the arguments so the last occurrence wins.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"usagemonitor command line"};
  app.footer(log_category_help_text());
  CliOptions options;
  std::vector<std::string> filtered_args;
  filtered_args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    std::string arg = argv[i] != nullptr ? argv[i] : "";
    if (i > 0 && arg == "--log-compress") {
      options.log_compress = true;
      options.log_compress_explicit = true;
      continue;
    }
    if (i > 0 && arg == "--no-log-compress") {
      options.log_compress = false;
      options.log_compress_explicit = true;
      continue;
    }
    filtered_args.push_back(std::move(arg));
  }

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "usagemonitor " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  auto *log_level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->default_val("info")
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Override a logging category level (NAME=LEVEL)")
      ->type_name("NAME=LEVEL")
      ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "value must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to keep (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag("--log-compress", "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_flag("--no-log-compress", "Keep rotated log files uncompressed")
      ->group("Logging");

  app.add_option("--org-id", options.organization_id, "Organization id")
      ->type_name("ID")
      ->group("Credentials");
  app.add_option("--session-token", options.session_token,
                 "Session token used to authenticate usage requests")
      ->type_name("TOKEN")
      ->group("Credentials");
  auto *save_flag = app.add_flag("--save-credentials", options.save_credentials,
                                 "Persist the supplied credentials")
                        ->group("Credentials");
  auto *clear_flag =
      app.add_flag("--clear-credentials", options.clear_credentials,
                   "Remove stored credentials")
          ->group("Credentials");
  clear_flag->excludes(save_flag);

  app.add_option_function<std::string>(
         "--interval",
         [&options](const std::string &value) {
           std::chrono::seconds duration;
           try {
             duration = parse_duration(value);
           } catch (const std::exception &e) {
             throw CLI::ValidationError("--interval", e.what());
           }
           if (duration.count() <= 0) {
             throw CLI::ValidationError("--interval",
                                        "interval must be positive");
           }
           if (duration.count() >
               static_cast<long long>(kMaxIntervalMinutes) * 60) {
             throw CLI::ValidationError(
                 "--interval", "interval must not exceed " +
                                   std::to_string(kMaxIntervalMinutes) +
                                   " minutes");
           }
           options.interval_minutes = ceil_minutes(duration);
         },
         "Refresh interval for this run such as 5m or 1h30m (rounded up to "
         "minutes)")
      ->type_name("DURATION")
      ->group("Refresh");
  app.add_flag("--disable-auto-refresh", options.disable_auto_refresh,
               "Only fetch when requested during this run")
      ->group("Refresh");
  app.add_flag("--hourly-refresh", options.hourly_refresh,
               "Align fetches shortly after the top of each hour")
      ->group("Refresh");
  app.add_flag("--once", options.once, "Fetch usage once and exit")
      ->group("Refresh");

  app.add_option("--history", options.history_range,
                 "Print usage trends for a range and exit")
      ->type_name("RANGE")
      ->check(CLI::IsMember({"1h", "6h", "24h", "7d", "30d"}))
      ->group("History");
  app.add_option_function<int>(
         "--prune-history",
         [&options](int days) {
           if (days < 0) {
             throw CLI::ValidationError("--prune-history",
                                        "value must be non-negative");
           }
           options.prune_history_days = days;
         },
         "Delete history older than DAYS and exit")
      ->type_name("DAYS")
      ->group("History");
  app.add_option("--export-csv", options.export_csv,
                 "Export usage history to a CSV file and exit")
      ->type_name("FILE")
      ->group("History");
  app.add_option("--export-json", options.export_json,
                 "Export usage history to a JSON file and exit")
      ->type_name("FILE")
      ->group("History");

  try {
    std::vector<char *> args;
    args.reserve(filtered_args.size() + 1);
    for (auto &arg : filtered_args) {
      args.push_back(arg.data());
    }
    args.push_back(nullptr);
    app.parse(static_cast<int>(filtered_args.size()), args.data());
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  options.log_level_explicit = log_level_opt->count() > 0U;

  if (options.organization_id.empty() && options.session_token.empty()) {
    options.organization_id = get_env_var("USAGEMONITOR_ORG_ID");
    options.session_token = get_env_var("USAGEMONITOR_SESSION_TOKEN");
    options.credentials_from_env = options.has_credentials();
    if (options.credentials_from_env) {
      cli_log()->debug("Using credentials from the environment");
    }
  }
  if (options.organization_id.empty() != options.session_token.empty()) {
    throw CLI::ValidationError(
        "--org-id and --session-token must be supplied together");
  }
  if (options.save_credentials && !options.has_credentials()) {
    throw CLI::ValidationError(
        "--save-credentials requires --org-id and --session-token");
  }
  return options;
}

} // namespace umon
