#include "app.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "util/time.hpp"
#include "validation.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace umon {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::string format_optional(const std::optional<double> &value,
                            const char *suffix) {
  if (!value) {
    return "-";
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%s", *value, suffix);
  return buf;
}

void log_usage(const UsageUpdatedEvent &event) {
  for (auto dim : kAllDimensions) {
    const auto &period = event.snapshot.period(dim);
    if (!period) {
      continue;
    }
    std::string resets;
    if (period->resets_at) {
      if (auto at = parse_rfc3339(*period->resets_at)) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            *at - std::chrono::system_clock::now());
        resets = " (resets in " + format_minutes(seconds.count() / 60) + ")";
      }
    }
    app_log()->info("{}: {:.1f}%{}", dimension_label(dim), period->utilization,
                    resets);
  }
  if (event.next_refresh_at_ms) {
    auto next = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(*event.next_refresh_at_ms));
    app_log()->debug("Next refresh at {}", format_rfc3339(next));
  }
}
} // namespace

App::~App() = default;

/**
 * Execute the main application flow.
 *
 * This routine orchestrates CLI parsing, configuration loading, logger
 * initialization and the wiring of every service. One-shot commands run to
 * completion here.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
  } catch (const std::exception &e) {
    app_log()->error("Failed to load configuration: {}", e.what());
    should_exit_ = true;
    return 1;
  }

  std::string level_str = options_.verbose ? "debug" : config_.log_level();
  if (options_.log_level_explicit) {
    level_str = options_.log_level;
  }
  spdlog::level::level_enum lvl = spdlog::level::info;
  try {
    lvl = parse_log_level(level_str);
  } catch (const std::invalid_argument &e) {
    app_log()->warn("{}; using info", e.what());
  }
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_compress_explicit) {
    options_.log_compress = config_.log_compress();
  }
  std::string log_file =
      options_.log_file.empty() ? config_.log_file() : options_.log_file;
  init_logger(lvl, config_.log_pattern(), log_file,
              static_cast<std::size_t>(options_.log_rotate),
              options_.log_compress);
  std::unordered_map<std::string, std::string> categories =
      config_.log_categories();
  for (const auto &[name, level] : options_.log_categories) {
    categories[name] = level;
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_name] : categories) {
    try {
      category_levels[category] = parse_log_level(level_name);
    } catch (const std::invalid_argument &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_name, category);
    }
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }

  int rc = configure();
  if (rc != 0 || should_exit_) {
    should_exit_ = true;
    return rc;
  }
  if (!options_.history_range.empty() || options_.prune_history_days ||
      !options_.export_csv.empty() || !options_.export_json.empty()) {
    should_exit_ = true;
    return run_history_commands();
  }
  if (options_.once) {
    should_exit_ = true;
    return run_once();
  }
  app_log()->info("usagemonitor {} ready", kVersionString);
  return 0;
}

std::string App::resolve_path(const std::string &configured,
                              const std::string &file_name) const {
  if (!configured.empty()) {
    return configured;
  }
  std::filesystem::path dir(default_data_dir());
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    app_log()->warn("Unable to create data directory {}: {}", dir.string(),
                    ec.message());
  }
  return (dir / file_name).string();
}

/**
 * Build the stores, shared configuration and refresh services, applying
 * credential and refresh overrides from the command line.
 */
int App::configure() {
  try {
    auto credentials_path =
        resolve_path(config_.credentials_file(), "credentials.json");
    if (options_.has_credentials() && !options_.save_credentials) {
      validate_org_id(options_.organization_id);
      validate_session_token(options_.session_token);
      auto session = std::make_unique<MemoryCredentialStore>();
      session->save({options_.organization_id, options_.session_token});
      credential_store_ = std::move(session);
      app_log()->debug("Using session credentials for organization {} "
                       "(token {})",
                       options_.organization_id,
                       mask_secret(options_.session_token));
    } else {
      credential_store_ =
          std::make_unique<FileCredentialStore>(credentials_path);
    }
    settings_store_ = std::make_unique<JsonFileSettingsStore>(
        resolve_path(config_.settings_file(), "settings.json"));
    history_ = std::make_unique<UsageHistory>(
        resolve_path(config_.history_db(), "history.db"));

    shared_config_ = std::make_unique<SharedConfig>(credential_store_.get(),
                                                    settings_store_.get());
    shared_config_->load();

    if (options_.clear_credentials) {
      shared_config_->clear_credentials();
      app_log()->info("Stored credentials removed");
      should_exit_ = true;
      return 0;
    }
    if (options_.save_credentials) {
      shared_config_->set_credentials(options_.organization_id,
                                      options_.session_token);
      app_log()->info("Credentials saved for organization {}",
                      options_.organization_id);
      should_exit_ = true;
      return 0;
    }

    auto refresh = shared_config_->auto_refresh();
    if (!settings_store_->get(kAutoRefreshKey)) {
      refresh.enabled = config_.auto_refresh();
      refresh.interval_minutes = config_.interval_minutes();
    }
    if (options_.interval_minutes) {
      refresh.interval_minutes = *options_.interval_minutes;
    }
    if (options_.disable_auto_refresh) {
      refresh.enabled = false;
    }
    shared_config_->override_auto_refresh(refresh.enabled,
                                          refresh.interval_minutes);
  } catch (const ValidationError &e) {
    app_log()->error("Invalid {}: {}", e.field(), e.what());
    return 2;
  } catch (const StorageError &e) {
    app_log()->error("Storage failure: {}", e.what());
    return 1;
  }

  if (config_.history_retention_days() > 0) {
    auto cutoff = std::chrono::system_clock::now() -
                  std::chrono::hours(24) * config_.history_retention_days();
    try {
      auto removed = history_->prune(cutoff);
      if (removed > 0) {
        app_log()->info("Pruned {} history record(s) older than {} day(s)",
                        removed, config_.history_retention_days());
      }
    } catch (const StorageError &e) {
      app_log()->warn("History pruning failed: {}", e.what());
    }
  }

  if (config_.desktop_notifications()) {
    notifier_ = std::make_shared<DesktopNotifier>();
  }
  std::string user_agent = config_.user_agent().empty()
                               ? std::string("usagemonitor/") + kVersionString
                               : config_.user_agent();
  fetcher_ = std::make_unique<UsageFetcher>(
      std::make_unique<CurlHttpClient>(
          static_cast<long>(config_.http_timeout()) * 1000,
          config_.http_proxy(), config_.https_proxy()),
      config_.api_base(), user_agent);
  events_ = std::make_unique<EventChannel>();
  events_->on_usage_updated(log_usage);
  events_->on_usage_error([](const UsageErrorEvent &event) {
    app_log()->error("{}", event.message);
  });

  SupervisorOptions supervisor_options;
  supervisor_options.backoff_initial =
      std::chrono::seconds(config_.backoff_initial_seconds());
  supervisor_options.backoff_max =
      std::chrono::seconds(config_.backoff_max_seconds());
  supervisor_options.hourly_refresh =
      options_.hourly_refresh || config_.hourly_refresh();
  supervisor_ = std::make_unique<RefreshSupervisor>(
      *shared_config_, *fetcher_, *events_, history_.get(), notifier_,
      supervisor_options);
  return 0;
}

int App::run_history_commands() {
  auto now = std::chrono::system_clock::now();
  try {
    if (options_.prune_history_days) {
      auto removed = history_->prune(
          now - std::chrono::hours(24) * *options_.prune_history_days);
      std::cout << "Removed " << removed << " history record(s)" << std::endl;
    }
    if (!options_.history_range.empty()) {
      auto stats = history_->stats(options_.history_range, now);
      std::cout << "Usage over " << options_.history_range << " ("
                << stats.record_count << " record(s))" << std::endl;
      for (auto dim : kAllDimensions) {
        const auto &metric = stats.metric(dim);
        std::cout << "  " << dimension_label(dim)
                  << ": current " << format_optional(metric.current, "%")
                  << ", change " << format_optional(metric.change, "%")
                  << ", velocity " << format_optional(metric.velocity, "%/h")
                  << std::endl;
      }
    }
    if (!options_.export_csv.empty()) {
      history_->export_csv(options_.export_csv);
      app_log()->info("History exported to {}", options_.export_csv);
    }
    if (!options_.export_json.empty()) {
      history_->export_json(options_.export_json);
      app_log()->info("History exported to {}", options_.export_json);
    }
  } catch (const StorageError &e) {
    app_log()->error("History command failed: {}", e.what());
    return 1;
  }
  return 0;
}

int App::run_once() {
  if (!shared_config_->is_configured()) {
    app_log()->error("No credentials configured; use --org-id and "
                     "--session-token");
    return 2;
  }
  auto outcome = supervisor_->run_once();
  if (!outcome.ok()) {
    return 1;
  }
  std::cout << outcome.snapshot().to_json().dump(2) << std::endl;
  return 0;
}

int App::serve(const std::function<bool()> &should_stop,
               const std::function<bool()> &refresh_requested) {
  if (!supervisor_) {
    app_log()->error("Application is not configured");
    return 1;
  }
  if (!shared_config_->is_configured()) {
    app_log()->warn("No credentials configured; waiting for credentials");
  }
  supervisor_->start();
  while (!should_stop()) {
    if (refresh_requested && refresh_requested()) {
      app_log()->info("Manual refresh requested");
      supervisor_->refresh_now();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  app_log()->info("Shutting down");
  supervisor_->stop();
  return 0;
}

} // namespace umon
