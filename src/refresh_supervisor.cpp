#include "refresh_supervisor.hpp"
#include "log.hpp"
#include "notification_rules.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> supervisor_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("supervisor");
  }();
  return logger;
}

} // namespace

const char *to_string(SupervisorState::Phase phase) {
  switch (phase) {
  case SupervisorState::Phase::Idle:
    return "idle";
  case SupervisorState::Phase::Waiting:
    return "waiting";
  case SupervisorState::Phase::Fetching:
    return "fetching";
  case SupervisorState::Phase::Backoff:
    return "backoff";
  }
  return "unknown";
}

RefreshSupervisor::RefreshSupervisor(SharedConfig &config, UsageSource &source,
                                     EventChannel &events,
                                     SnapshotStore *history,
                                     NotifierPtr notifier,
                                     SupervisorOptions options)
    : config_(config), source_(source), events_(events), history_(history),
      notifier_(std::move(notifier)), options_(options),
      backoff_(options.backoff_initial, options.backoff_max),
      rng_(std::random_device{}()) {
  subscription_ = config_.subscribe([this] { notify_wake(); });
}

RefreshSupervisor::~RefreshSupervisor() {
  config_.unsubscribe(subscription_);
  stop();
}

void RefreshSupervisor::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread(&RefreshSupervisor::loop, this);
  supervisor_log()->debug("Refresh loop started");
}

void RefreshSupervisor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  thread_.join();
  supervisor_log()->debug("Refresh loop stopped");
}

bool RefreshSupervisor::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_.joinable() && !stopping_;
}

void RefreshSupervisor::refresh_now() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_requested_ = true;
  }
  cv_.notify_all();
}

void RefreshSupervisor::notify_wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    restart_pending_ = true;
  }
  cv_.notify_all();
}

FetchOutcome RefreshSupervisor::run_once() {
  auto config = config_.auto_refresh();
  if (!config.has_credentials()) {
    throw std::runtime_error("No credentials configured");
  }
  return run_cycle(config).outcome;
}

SupervisorState RefreshSupervisor::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::size_t RefreshSupervisor::fetch_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fetch_count_;
}

void RefreshSupervisor::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    bool restart = restart_pending_;
    bool manual = refresh_requested_;
    restart_pending_ = false;
    refresh_requested_ = false;
    lock.unlock();

    if (restart) {
      reset_backoff();
    }
    auto config = config_.auto_refresh();
    std::optional<std::chrono::milliseconds> delay;
    if (!config.has_credentials()) {
      if (manual) {
        supervisor_log()->info("Refresh ignored: no credentials configured");
      }
      reset_backoff();
      set_state(SupervisorState::Phase::Idle, 0, std::nullopt);
    } else if (!config.enabled && !manual) {
      reset_backoff();
      set_state(SupervisorState::Phase::Waiting, 0, std::nullopt);
    } else {
      delay = run_cycle(config).delay;
    }

    lock.lock();
    auto signalled = [this] {
      return stopping_ || restart_pending_ || refresh_requested_;
    };
    if (delay) {
      cv_.wait_for(lock, *delay, signalled);
    } else {
      cv_.wait(lock, signalled);
    }
  }
}

RefreshSupervisor::CycleResult
RefreshSupervisor::run_cycle(const AutoRefreshConfig &config) {
  std::lock_guard<std::mutex> cycle(cycle_mutex_);
  const auto &credentials = *config.credentials;
  set_state(SupervisorState::Phase::Fetching, backoff_.attempt(),
            std::nullopt);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_count_;
  }

  auto outcome = FetchOutcome::failure(FetchError::Network);
  try {
    outcome = source_.fetch(credentials.organization_id,
                            credentials.session_token);
  } catch (const std::exception &e) {
    supervisor_log()->error("Fetch failed unexpectedly: {}", e.what());
    outcome = FetchOutcome::failure(FetchError::Network, 0, e.what());
  }

  if (outcome.ok() || outcome.error() != FetchError::RateLimited) {
    backoff_.reset();
  } else {
    auto wait = backoff_.on_rate_limited();
    supervisor_log()->warn("Rate limited, backing off {} ms (attempt {})",
                           wait.count(), backoff_.attempt());
  }

  auto delay = next_delay(config);
  auto now = std::chrono::system_clock::now();
  std::optional<std::chrono::system_clock::time_point> until;
  std::optional<std::int64_t> next_refresh_at_ms;
  if (delay) {
    until = now + *delay;
    next_refresh_at_ms = to_unix_millis(*until);
  }
  if (delay && backoff_.active()) {
    set_state(SupervisorState::Phase::Backoff, backoff_.attempt(), until);
  } else {
    set_state(SupervisorState::Phase::Waiting, 0, until);
  }

  try {
    if (outcome.ok()) {
      handle_success(outcome.snapshot(), next_refresh_at_ms);
    } else if (outcome.error() != FetchError::RateLimited) {
      supervisor_log()->warn("Usage fetch failed ({}): {}",
                             to_string(outcome.error()),
                             outcome.detail().empty() ? outcome.message()
                                                      : outcome.detail());
      events_.publish(UsageErrorEvent{outcome.error(), outcome.message()});
    }
  } catch (const std::exception &e) {
    supervisor_log()->error("Refresh cycle failed: {}", e.what());
    events_.publish(
        UsageErrorEvent{FetchError::Network, describe(FetchError::Network)});
  }
  return CycleResult{outcome, delay};
}

void RefreshSupervisor::handle_success(
    const UsageSnapshot &snapshot,
    std::optional<std::int64_t> next_refresh_at_ms) {
  auto now = std::chrono::system_clock::now();
  if (history_) {
    try {
      history_->append(snapshot, now);
    } catch (const std::exception &e) {
      supervisor_log()->warn("Failed to record usage history: {}", e.what());
    }
  }

  auto result = evaluate(snapshot, config_.notification_settings(),
                         config_.notification_state(), now);
  config_.store_notification_state(result.state);

  if (!result.events.empty() && notifier_) {
    if (notifier_->request_permission()) {
      for (const auto &event : result.events) {
        try {
          notifier_->notify(event.title(), event.body());
        } catch (const std::exception &e) {
          supervisor_log()->warn("Failed to deliver notification: {}",
                                 e.what());
        }
      }
    } else {
      supervisor_log()->debug("Notification permission denied, dropping {} "
                              "event(s)",
                              result.events.size());
    }
  }

  supervisor_log()->info("Usage updated");
  events_.publish(UsageUpdatedEvent{snapshot, next_refresh_at_ms});
}

std::optional<std::chrono::milliseconds>
RefreshSupervisor::next_delay(const AutoRefreshConfig &config) {
  if (!config.enabled) {
    return std::nullopt;
  }
  if (backoff_.active()) {
    return backoff_.current_delay();
  }
  auto delay = options_.interval_unit * config.interval_minutes;
  if (options_.hourly_refresh) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                       now.time_since_epoch())
                       .count();
    auto to_next_hour = 3600 - seconds % 3600;
    std::uniform_int_distribution<int> jitter(0, 55);
    std::chrono::milliseconds aligned =
        std::chrono::seconds(to_next_hour + 5 + jitter(rng_));
    delay = std::min(delay, aligned);
  }
  return delay;
}

void RefreshSupervisor::reset_backoff() {
  std::lock_guard<std::mutex> cycle(cycle_mutex_);
  backoff_.reset();
}

void RefreshSupervisor::set_state(
    SupervisorState::Phase phase, int attempt,
    std::optional<std::chrono::system_clock::time_point> until) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.phase = phase;
  state_.attempt = attempt;
  state_.until = until;
}

} // namespace umon
