/**
 * @file refresh_supervisor.hpp
 * @brief Background polling loop driving fetches, notifications and history.
 *
 * A single long-lived thread schedules fetches at the configured interval,
 * restarts immediately when the shared configuration changes, backs off
 * exponentially after rate-limited responses and publishes the outcome of
 * each cycle on the event channel.
 */

#ifndef USAGEMONITOR_REFRESH_SUPERVISOR_HPP
#define USAGEMONITOR_REFRESH_SUPERVISOR_HPP

#include "backoff.hpp"
#include "event_channel.hpp"
#include "history.hpp"
#include "notification.hpp"
#include "shared_config.hpp"
#include "usage_fetcher.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

namespace umon {

/// Tuning knobs of the refresh loop.
struct SupervisorOptions {
  std::chrono::milliseconds backoff_initial{std::chrono::seconds(30)};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(300)};
  /// Length of one configured interval unit; a minute outside of tests.
  std::chrono::milliseconds interval_unit{std::chrono::minutes(1)};
  /// Align scheduled fetches shortly after the top of each hour.
  bool hourly_refresh{false};
};

/// Observable state of the supervisor.
struct SupervisorState {
  enum class Phase { Idle, Waiting, Fetching, Backoff };

  Phase phase{Phase::Idle};
  /// Consecutive rate-limited attempts, non-zero only in Backoff.
  int attempt{0};
  /// Time of the next scheduled fetch, if any.
  std::optional<std::chrono::system_clock::time_point> until;
};

const char *to_string(SupervisorState::Phase phase);

class RefreshSupervisor {
public:
  /**
   * @param config Shared configuration; restart signals are subscribed to
   *        for the lifetime of the supervisor.
   * @param source Usage source performing fetches.
   * @param events Channel receiving cycle results.
   * @param history Optional snapshot store.
   * @param notifier Optional notification sink.
   * @param options Loop timing.
   */
  RefreshSupervisor(SharedConfig &config, UsageSource &source,
                    EventChannel &events, SnapshotStore *history = nullptr,
                    NotifierPtr notifier = nullptr,
                    SupervisorOptions options = {});

  /// Unsubscribes from the configuration and stops the loop.
  ~RefreshSupervisor();

  RefreshSupervisor(const RefreshSupervisor &) = delete;
  RefreshSupervisor &operator=(const RefreshSupervisor &) = delete;

  /// Launch the background loop. Calling it twice has no effect.
  void start();

  /// Stop the loop and join its thread. An in-flight fetch completes first.
  void stop();

  bool running() const;

  /**
   * Fetch immediately, collapsing any pending wait or backoff. The backoff
   * counter is left untouched.
   */
  void refresh_now();

  /**
   * Abandon the current wait or backoff and re-read the configuration.
   * Used after configuration changes and system resume.
   */
  void notify_wake();

  /**
   * Run one fetch cycle on the calling thread.
   *
   * @return Outcome of the fetch.
   * @throws std::runtime_error When no credentials are configured.
   */
  FetchOutcome run_once();

  SupervisorState state() const;

  /// Number of fetches issued so far.
  std::size_t fetch_count() const;

private:
  struct CycleResult {
    FetchOutcome outcome;
    std::optional<std::chrono::milliseconds> delay;
  };

  void loop();
  CycleResult run_cycle(const AutoRefreshConfig &config);
  void handle_success(const UsageSnapshot &snapshot,
                      std::optional<std::int64_t> next_refresh_at_ms);
  std::optional<std::chrono::milliseconds>
  next_delay(const AutoRefreshConfig &config);
  void reset_backoff();
  void set_state(SupervisorState::Phase phase, int attempt,
                 std::optional<std::chrono::system_clock::time_point> until);

  SharedConfig &config_;
  UsageSource &source_;
  EventChannel &events_;
  SnapshotStore *history_;
  NotifierPtr notifier_;
  SupervisorOptions options_;
  std::size_t subscription_{0};

  // Serializes cycles between the loop and run_once().
  std::mutex cycle_mutex_;
  BackoffPolicy backoff_;
  std::mt19937 rng_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SupervisorState state_;
  std::size_t fetch_count_{0};
  bool restart_pending_{false};
  bool refresh_requested_{false};
  bool stopping_{false};
  std::thread thread_;
};

} // namespace umon

#endif // USAGEMONITOR_REFRESH_SUPERVISOR_HPP
