#include "errors.hpp"
#include "settings_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace umon;
namespace fs = std::filesystem;

namespace {

fs::path scratch_file(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / "umon_settings_tests";
  fs::create_directories(dir);
  fs::path file = dir / name;
  fs::remove(file);
  return file;
}

} // namespace

TEST_CASE("settings file persists values across instances", "[settings]") {
  auto path = scratch_file("persist.json");
  {
    JsonFileSettingsStore store(path.string());
    CHECK_FALSE(store.get(kAutoRefreshKey));
    store.set(kAutoRefreshKey, {{"enabled", false}, {"intervalMinutes", 15}});
  }
  JsonFileSettingsStore reopened(path.string());
  auto value = reopened.get(kAutoRefreshKey);
  REQUIRE(value);
  CHECK((*value)["intervalMinutes"] == 15);
  CHECK_FALSE(fs::exists(path.string() + ".tmp"));
  reopened.clear();
  CHECK_FALSE(reopened.get(kAutoRefreshKey));
  fs::remove(path);
}

TEST_CASE("corrupt settings file starts empty", "[settings]") {
  auto path = scratch_file("corrupt.json");
  {
    std::ofstream out(path);
    out << "{\"autoRefresh\": [1, 2";
  }
  JsonFileSettingsStore store(path.string());
  CHECK_FALSE(store.get(kAutoRefreshKey));
  store.set(kNotificationStateKey, nlohmann::json::object());
  CHECK(store.get(kNotificationStateKey));
  fs::remove(path);
}

TEST_CASE("notification settings fall back per field", "[settings]") {
  auto j = nlohmann::json::parse(R"({
    "enabled": "yes",
    "five_hour": {
      "interval_enabled": true,
      "interval_percent": -5,
      "thresholds": [50, 75],
      "time_remaining_minutes": [15, "x"]
    },
    "seven_day": "garbage"
  })");
  auto settings = decode_notification_settings(j);
  CHECK(settings.enabled);
  const auto &five = settings.rule(UsageDimension::FiveHour);
  CHECK(five.interval_enabled);
  CHECK(five.interval_percent == 10);
  CHECK(five.thresholds == std::set<int>{50, 75});
  CHECK(five.time_remaining_minutes == std::set<int>{30, 60});
  CHECK(settings.rule(UsageDimension::SevenDay) == NotificationRule{});
}

TEST_CASE("thresholds outside 0-100 are rejected", "[settings]") {
  auto j = nlohmann::json::parse(
      R"({"seven_day_opus": {"thresholds": [80, 150]}})");
  auto settings = decode_notification_settings(j);
  CHECK(settings.rule(UsageDimension::SevenDayOpus).thresholds ==
        std::set<int>{80, 90});
}

TEST_CASE("notification settings and state encode and decode", "[settings]") {
  NotificationSettings settings;
  settings.enabled = false;
  settings.rule(UsageDimension::SevenDaySonnet).thresholds = {25, 50};
  settings.rule(UsageDimension::SevenDaySonnet).time_remaining_enabled = true;
  CHECK(decode_notification_settings(to_json(settings)) == settings);

  NotificationState state;
  state.set_last(UsageDimension::SevenDay, 63.5);
  state.fired_thresholds = {"seven_day:50"};
  state.fired_time_remaining = {"five_hour:time:30"};
  auto encoded = to_json(state);
  CHECK(encoded["seven_day_last"] == 63.5);
  CHECK(decode_notification_state(encoded) == state);
  CHECK(decode_notification_state(nlohmann::json("junk")) ==
        NotificationState{});
}

TEST_CASE("auto refresh preferences decode onto a base config",
          "[settings]") {
  AutoRefreshConfig base;
  base.credentials = Credentials{"org", "token"};
  auto decoded = decode_auto_refresh(
      nlohmann::json::parse(R"({"enabled": false, "intervalMinutes": 0})"),
      base);
  CHECK_FALSE(decoded.enabled);
  CHECK(decoded.interval_minutes == 5);
  CHECK(decoded.credentials == base.credentials);
  CHECK(auto_refresh_to_json(decoded)["enabled"] == false);

  CHECK(decode_auto_refresh({{"intervalMinutes", kMaxIntervalMinutes}}, base)
            .interval_minutes == kMaxIntervalMinutes);
  CHECK(decode_auto_refresh({{"intervalMinutes", kMaxIntervalMinutes + 1}},
                            base)
            .interval_minutes == 5);
}
