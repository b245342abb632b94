#include "notification_rules.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace umon;
using namespace std::chrono;

namespace {

const system_clock::time_point kNow =
    *parse_rfc3339("2025-03-01T12:00:00Z");

UsageSnapshot five_hour_at(double utilization,
                           std::optional<std::string> resets_at = {}) {
  return UsageSnapshot(UsagePeriod{utilization, std::move(resets_at)},
                       std::nullopt, std::nullopt, std::nullopt);
}

NotificationSettings thresholds_only() {
  NotificationSettings settings;
  for (auto &rule : settings.rules) {
    rule.interval_enabled = false;
    rule.threshold_enabled = true;
    rule.thresholds = {80, 90};
    rule.time_remaining_enabled = false;
  }
  return settings;
}

NotificationSettings interval_only(int percent) {
  NotificationSettings settings;
  for (auto &rule : settings.rules) {
    rule.interval_enabled = true;
    rule.interval_percent = percent;
    rule.threshold_enabled = false;
    rule.time_remaining_enabled = false;
  }
  return settings;
}

} // namespace

TEST_CASE("default rules match the documented defaults", "[evaluator]") {
  NotificationRule rule;
  CHECK_FALSE(rule.interval_enabled);
  CHECK(rule.interval_percent == 10);
  CHECK(rule.threshold_enabled);
  CHECK(rule.thresholds == std::set<int>{80, 90});
  CHECK_FALSE(rule.time_remaining_enabled);
  CHECK(rule.time_remaining_minutes == std::set<int>{30, 60});
  CHECK(NotificationSettings{}.enabled);
}

TEST_CASE("threshold crossing and rollover scenario", "[evaluator]") {
  auto settings = thresholds_only();
  NotificationState state;

  auto cycle1 = evaluate(five_hour_at(0), settings, state, kNow);
  CHECK(cycle1.events.empty());

  auto cycle2 = evaluate(five_hour_at(45), settings, cycle1.state, kNow);
  CHECK(cycle2.events.empty());

  auto cycle3 = evaluate(five_hour_at(82), settings, cycle2.state, kNow);
  REQUIRE(cycle3.events.size() == 1);
  CHECK(cycle3.events[0].title() == "5 Hour Usage Alert");
  CHECK(cycle3.events[0].body() == "Usage crossed 80% threshold (82% used)");
  CHECK(cycle3.state.fired_thresholds.count("five_hour:80") == 1);

  auto cycle4 = evaluate(five_hour_at(35), settings, cycle3.state, kNow);
  CHECK(cycle4.events.empty());
  CHECK(cycle4.state.fired_thresholds.empty());
  CHECK(cycle4.state.last(UsageDimension::FiveHour) == 35.0);

  auto cycle5 = evaluate(five_hour_at(81), settings, cycle4.state, kNow);
  REQUIRE(cycle5.events.size() == 1);
  CHECK(cycle5.events[0].triggers[0].value == 80);
}

TEST_CASE("a drop of exactly 20 points is not a reset", "[evaluator]") {
  auto settings = thresholds_only();
  auto first = evaluate(five_hour_at(85), settings, {}, kNow);
  REQUIRE(first.events.size() == 1);
  auto second = evaluate(five_hour_at(65), settings, first.state, kNow);
  CHECK(second.state.fired_thresholds.count("five_hour:80") == 1);
  auto third = evaluate(five_hour_at(85), settings, second.state, kNow);
  CHECK(third.events.empty());
}

TEST_CASE("thresholds fire at most once between resets", "[evaluator]") {
  auto settings = thresholds_only();
  NotificationState state;
  int fired = 0;
  for (double u : {79.0, 85.0, 85.0, 88.0, 70.0, 86.0}) {
    auto result = evaluate(five_hour_at(u), settings, state, kNow);
    for (const auto &event : result.events) {
      fired += static_cast<int>(event.triggers.size());
    }
    state = result.state;
  }
  CHECK(fired == 1);
}

TEST_CASE("a jump across several thresholds is coalesced", "[evaluator]") {
  auto settings = thresholds_only();
  auto result = evaluate(five_hour_at(95), settings, {}, kNow);
  REQUIRE(result.events.size() == 1);
  REQUIRE(result.events[0].triggers.size() == 2);
  CHECK(result.events[0].triggers[0].value == 80);
  CHECK(result.events[0].triggers[1].value == 90);
  CHECK(result.events[0].body() ==
        "Usage crossed 80% threshold and crossed 90% threshold (95% used)");
}

TEST_CASE("interval check reports only the final crossed level",
          "[evaluator]") {
  auto settings = interval_only(10);
  NotificationState state;
  state.set_last(UsageDimension::FiveHour, 12);
  auto result = evaluate(five_hour_at(47), settings, state, kNow);
  REQUIRE(result.events.size() == 1);
  REQUIRE(result.events[0].triggers.size() == 1);
  CHECK(result.events[0].triggers[0].kind ==
        NotificationTrigger::Kind::Interval);
  CHECK(result.events[0].triggers[0].value == 40);
  CHECK(result.events[0].body() == "Usage reached 40% (47% used)");
}

TEST_CASE("interval events count the crossed levels", "[evaluator]") {
  const int p = 10;
  auto settings = interval_only(p);
  NotificationState state;
  state.set_last(UsageDimension::FiveHour, 3);
  int events = 0;
  for (double u : {8.0, 11.0, 19.0, 24.0, 31.0, 42.0, 42.5, 57.0}) {
    auto result = evaluate(five_hour_at(u), settings, state, kNow);
    for (const auto &event : result.events) {
      for (const auto &trigger : event.triggers) {
        CHECK(trigger.value % p == 0);
        ++events;
      }
    }
    state = result.state;
  }
  CHECK(events == static_cast<int>(std::floor(57.0 / p) - std::floor(3.0 / p)));
}

TEST_CASE("reset clears only the dropping dimension", "[evaluator]") {
  auto settings = thresholds_only();
  UsageSnapshot high(UsagePeriod{85, std::nullopt}, UsagePeriod{92, std::nullopt},
                     std::nullopt, std::nullopt);
  auto first = evaluate(high, settings, {}, kNow);
  CHECK(first.state.fired_thresholds.size() == 3);

  UsageSnapshot drop(UsagePeriod{10, std::nullopt}, UsagePeriod{92, std::nullopt},
                     std::nullopt, std::nullopt);
  auto second = evaluate(drop, settings, first.state, kNow);
  CHECK(second.state.fired_thresholds.count("five_hour:80") == 0);
  CHECK(second.state.fired_thresholds.count("seven_day:80") == 1);
  CHECK(second.state.fired_thresholds.count("seven_day:90") == 1);
}

TEST_CASE("time remaining alerts count down to the reset", "[evaluator]") {
  NotificationSettings settings;
  auto &rule = settings.rule(UsageDimension::FiveHour);
  rule.threshold_enabled = false;
  rule.time_remaining_enabled = true;
  rule.time_remaining_minutes = {30, 60};

  auto in_45 = evaluate(five_hour_at(50, std::string("2025-03-01T12:45:30Z")),
                        settings, {}, kNow);
  REQUIRE(in_45.events.size() == 1);
  REQUIRE(in_45.events[0].triggers.size() == 1);
  CHECK(in_45.events[0].triggers[0].value == 60);
  CHECK(in_45.events[0].body() == "Usage resets in < 1h (50% used)");
  CHECK(in_45.state.fired_time_remaining.count("five_hour:time:60") == 1);

  auto again = evaluate(five_hour_at(51, std::string("2025-03-01T12:45:30Z")),
                        settings, in_45.state, kNow + minutes(1));
  CHECK(again.events.empty());

  auto in_20 = evaluate(five_hour_at(52, std::string("2025-03-01T12:20:00Z")),
                        settings, again.state, kNow);
  REQUIRE(in_20.events.size() == 1);
  CHECK(in_20.events[0].triggers[0].value == 30);
  CHECK(in_20.events[0].body() == "Usage resets in < 30m (52% used)");
}

TEST_CASE("time remaining ignores past or malformed reset times",
          "[evaluator]") {
  NotificationSettings settings;
  auto &rule = settings.rule(UsageDimension::FiveHour);
  rule.threshold_enabled = false;
  rule.time_remaining_enabled = true;
  auto past = evaluate(five_hour_at(50, std::string("2025-03-01T11:00:00Z")),
                       settings, {}, kNow);
  CHECK(past.events.empty());
  auto garbage =
      evaluate(five_hour_at(50, std::string("soon")), settings, {}, kNow);
  CHECK(garbage.events.empty());
  CHECK(garbage.state.last(UsageDimension::FiveHour) == 50.0);
}

TEST_CASE("disabled notifications leave state untouched", "[evaluator]") {
  auto settings = thresholds_only();
  settings.enabled = false;
  NotificationState state;
  state.set_last(UsageDimension::FiveHour, 12);
  auto result = evaluate(five_hour_at(95), settings, state, kNow);
  CHECK(result.events.empty());
  CHECK(result.state == state);
}

TEST_CASE("absent dimensions are skipped", "[evaluator]") {
  auto settings = thresholds_only();
  NotificationState state;
  state.set_last(UsageDimension::SevenDayOpus, 95);
  auto result = evaluate(five_hour_at(10), settings, state, kNow);
  CHECK(result.state.last(UsageDimension::SevenDayOpus) == 95.0);
  CHECK(result.state.last(UsageDimension::FiveHour) == 10.0);
}

TEST_CASE("trigger phrases", "[evaluator]") {
  CHECK(NotificationTrigger{NotificationTrigger::Kind::TimeRemaining, 90}
            .describe() == "resets in < 1h 30m");
  NotificationEvent event{UsageDimension::SevenDaySonnet, 80.4, {}};
  CHECK(event.title() == "Sonnet (7 Day) Usage Alert");
}
