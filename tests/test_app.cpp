#include "app.hpp"
#include "credential_store.hpp"
#include "history.hpp"
#include "settings_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace umon;

namespace {

const char *kConfigPath = "app_test_cfg.json";
const char *kCredsPath = "app_test_creds.json";
const char *kSettingsPath = "app_test_settings.json";
const char *kHistoryPath = "app_test_history.db";

void reset_files() {
  unsetenv("USAGEMONITOR_ORG_ID");
  unsetenv("USAGEMONITOR_SESSION_TOKEN");
  for (const char *path : {kConfigPath, kCredsPath, kSettingsPath,
                           kHistoryPath, "app_test_export.json"}) {
    std::remove(path);
  }
  std::ofstream f(kConfigPath);
  f << R"({"storage": {"credentials_file": "app_test_creds.json",
                       "settings_file": "app_test_settings.json",
                       "history_db": "app_test_history.db",
                       "history_retention_days": 0},
           "notifications": {"desktop_notifications": false},
           "logging": {"log_level": "warn"}})";
}

int run_app(App &app, std::vector<std::string> args) {
  args.insert(args.begin(), {"usagemonitor", "--config", kConfigPath});
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return app.run(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST_CASE("app saves and clears credentials", "[app]") {
  reset_files();
  {
    App app;
    int rc = run_app(app, {"--org-id", "org-1", "--session-token", "tok-1",
                           "--save-credentials"});
    CHECK(rc == 0);
    CHECK(app.should_exit());
  }
  FileCredentialStore store(kCredsPath);
  auto loaded = store.load();
  REQUIRE(loaded);
  CHECK(loaded->organization_id == "org-1");
  CHECK(loaded->session_token == "tok-1");

  {
    App app;
    CHECK(run_app(app, {"--clear-credentials"}) == 0);
    CHECK(app.should_exit());
  }
  CHECK_FALSE(store.load());
}

TEST_CASE("app rejects malformed credentials", "[app]") {
  reset_files();
  App app;
  int rc = run_app(app, {"--org-id", "bad org", "--session-token", "tok",
                         "--save-credentials"});
  CHECK(rc == 2);
  CHECK(app.should_exit());
  CHECK_FALSE(FileCredentialStore(kCredsPath).load());
}

TEST_CASE("app once requires credentials", "[app]") {
  reset_files();
  App app;
  CHECK(run_app(app, {"--once"}) == 2);
  CHECK(app.should_exit());
}

TEST_CASE("app applies refresh overrides for the current run only",
          "[app]") {
  reset_files();
  {
    App app;
    CHECK(run_app(app, {"--interval", "10m", "--disable-auto-refresh"}) == 0);
    CHECK_FALSE(app.should_exit());
    auto refresh = app.shared_config().auto_refresh();
    CHECK(refresh.interval_minutes == 10);
    CHECK_FALSE(refresh.enabled);
  }
  {
    JsonFileSettingsStore settings(kSettingsPath);
    CHECK_FALSE(settings.get(kAutoRefreshKey));
    settings.set(kAutoRefreshKey, {{"enabled", true}, {"intervalMinutes", 7}});
  }
  {
    App app;
    CHECK(run_app(app, {"--interval", "20m"}) == 0);
    CHECK(app.shared_config().auto_refresh().interval_minutes == 20);
  }
  {
    App app;
    CHECK(run_app(app, {}) == 0);
    auto refresh = app.shared_config().auto_refresh();
    CHECK(refresh.interval_minutes == 7);
    CHECK(refresh.enabled);
  }
  JsonFileSettingsStore settings(kSettingsPath);
  auto stored = settings.get(kAutoRefreshKey);
  REQUIRE(stored);
  CHECK((*stored)["intervalMinutes"] == 7);
  CHECK((*stored)["enabled"] == true);
}

TEST_CASE("app rejects an out of range interval in the config file",
          "[app]") {
  reset_files();
  {
    std::ofstream f(kConfigPath);
    f << R"({"refresh": {"interval_minutes": 200000000},
             "storage": {"settings_file": "app_test_settings.json",
                         "credentials_file": "app_test_creds.json",
                         "history_db": "app_test_history.db"}})";
  }
  App app;
  CHECK(run_app(app, {}) != 0);
}

TEST_CASE("app history commands", "[app]") {
  reset_files();
  {
    UsageHistory history(kHistoryPath);
    history.append(UsageSnapshot(UsagePeriod{42.0, std::nullopt},
                                 std::nullopt, std::nullopt, std::nullopt),
                   std::chrono::system_clock::now());
  }
  App app;
  int rc = run_app(app, {"--history", "24h", "--export-json",
                         "app_test_export.json"});
  CHECK(rc == 0);
  CHECK(app.should_exit());
  REQUIRE(std::filesystem::exists("app_test_export.json"));
  std::ifstream in("app_test_export.json");
  auto exported = nlohmann::json::parse(in);
  REQUIRE(exported.is_array());
  CHECK(exported.size() == 1);
}

TEST_CASE("app reports parse exits", "[app]") {
  reset_files();
  App app;
  CHECK(run_app(app, {"--history", "2d"}) != 0);
  CHECK(app.should_exit());
}
