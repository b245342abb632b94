/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for usagemonitor.
 *
 * Declares the App class, which parses the command line, loads the
 * configuration, wires the stores, fetcher and refresh supervisor together
 * and runs one-shot commands or the background daemon.
 */

#ifndef USAGEMONITOR_APP_HPP
#define USAGEMONITOR_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "event_channel.hpp"
#include "history.hpp"
#include "notification.hpp"
#include "refresh_supervisor.hpp"
#include "settings_store.hpp"
#include "shared_config.hpp"
#include "usage_fetcher.hpp"

#include <functional>
#include <memory>
#include <string>

namespace umon {

class App {
public:
  ~App();

  /**
   * Run the application with the given command line arguments.
   *
   * One-shot commands (credential management, history queries, `--once`)
   * complete inside this call and set should_exit().
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Run the refresh supervisor until @p should_stop returns true.
   *
   * @param should_stop Polled periodically.
   * @param refresh_requested Polled periodically; a `true` result triggers an
   *        immediate fetch.
   * @return Process exit code.
   */
  int serve(const std::function<bool()> &should_stop,
            const std::function<bool()> &refresh_requested = {});

  const CliOptions &options() const { return options_; }
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

  /// Shared configuration; valid after a successful run().
  SharedConfig &shared_config() { return *shared_config_; }

private:
  int configure();
  int run_history_commands();
  int run_once();
  std::string resolve_path(const std::string &configured,
                           const std::string &file_name) const;

  CliOptions options_;
  Config config_;
  bool should_exit_{false};

  std::unique_ptr<CredentialStore> credential_store_;
  std::unique_ptr<SettingsStore> settings_store_;
  std::unique_ptr<UsageHistory> history_;
  std::unique_ptr<SharedConfig> shared_config_;
  std::unique_ptr<UsageSource> fetcher_;
  NotifierPtr notifier_;
  std::unique_ptr<EventChannel> events_;
  std::unique_ptr<RefreshSupervisor> supervisor_;
};

} // namespace umon

#endif // USAGEMONITOR_APP_HPP
