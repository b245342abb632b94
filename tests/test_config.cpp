#include "config.hpp"
#include "errors.hpp"
#include "refresh_config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace umon;

TEST_CASE("config defaults") {
  Config cfg;
  CHECK(cfg.interval_minutes() == 5);
  CHECK(cfg.auto_refresh());
  CHECK_FALSE(cfg.hourly_refresh());
  CHECK(cfg.backoff_initial_seconds() == 30);
  CHECK(cfg.backoff_max_seconds() == 300);
  CHECK(cfg.api_base() == "https://claude.ai");
  CHECK(cfg.http_timeout() == 30);
  CHECK(cfg.history_retention_days() == 30);
  CHECK(cfg.desktop_notifications());
}

TEST_CASE("config from grouped YAML") {
  {
    std::ofstream f("umon_cfg.yaml");
    f << "refresh:\n";
    f << "  interval_minutes: 10\n";
    f << "  enabled: false\n";
    f << "  hourly_refresh: true\n";
    f << "  backoff_initial_seconds: 15\n";
    f << "  backoff_max_seconds: 120\n";
    f << "network:\n";
    f << "  api_base: https://usage.example\n";
    f << "  http_timeout: 12\n";
    f << "  https_proxy: http://secureproxy\n";
    f << "storage:\n";
    f << "  history_db: hist.db\n";
    f << "  history_retention_days: 7\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 5\n";
    f << "  log_compress: true\n";
    f << "  log_categories:\n";
    f << "    supervisor: trace\n";
    f << "    http: ~\n";
    f << "notifications:\n";
    f << "  desktop_notifications: false\n";
  }
  Config cfg = Config::from_file("umon_cfg.yaml");
  CHECK(cfg.interval_minutes() == 10);
  CHECK_FALSE(cfg.auto_refresh());
  CHECK(cfg.hourly_refresh());
  CHECK(cfg.backoff_initial_seconds() == 15);
  CHECK(cfg.backoff_max_seconds() == 120);
  CHECK(cfg.api_base() == "https://usage.example");
  CHECK(cfg.http_timeout() == 12);
  CHECK(cfg.https_proxy() == "http://secureproxy");
  CHECK(cfg.history_db() == "hist.db");
  CHECK(cfg.history_retention_days() == 7);
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_rotate() == 5);
  CHECK(cfg.log_compress());
  REQUIRE(cfg.log_categories().size() == 2);
  CHECK(cfg.log_categories().at("supervisor") == "trace");
  CHECK(cfg.log_categories().at("http") == "debug");
  CHECK_FALSE(cfg.desktop_notifications());
  std::remove("umon_cfg.yaml");
}

TEST_CASE("config from flat JSON file") {
  {
    std::ofstream f("umon_cfg.json");
    f << R"({"interval_minutes": 3, "user_agent": "umon-test/1.0",
             "log_categories": ["fetcher=warn", "history"]})";
  }
  Config cfg = Config::from_file("umon_cfg.json");
  CHECK(cfg.interval_minutes() == 3);
  CHECK(cfg.user_agent() == "umon-test/1.0");
  CHECK(cfg.log_categories().at("fetcher") == "warn");
  CHECK(cfg.log_categories().at("history") == "debug");
  std::remove("umon_cfg.json");
}

TEST_CASE("config from TOML") {
  {
    std::ofstream f("umon_cfg.toml");
    f << "[refresh]\n";
    f << "interval_minutes = 15\n";
    f << "[storage]\n";
    f << "credentials_file = \"creds.toml\"\n";
    f << "[logging]\n";
    f << "log_file = \"umon.log\"\n";
  }
  Config cfg = Config::from_file("umon_cfg.toml");
  CHECK(cfg.interval_minutes() == 15);
  CHECK(cfg.credentials_file() == "creds.toml");
  CHECK(cfg.log_file() == "umon.log");
  std::remove("umon_cfg.toml");
}

TEST_CASE("config rejects invalid values") {
  CHECK_THROWS_AS(Config::from_json({{"interval_minutes", 0}}),
                  ValidationError);
  CHECK_THROWS_AS(Config::from_json({{"interval_minutes", 1000001}}),
                  ValidationError);
  CHECK_THROWS_AS(Config::from_json({{"interval_minutes", 200000000000LL}}),
                  ValidationError);
  CHECK(Config::from_json({{"interval_minutes", kMaxIntervalMinutes}})
            .interval_minutes() == kMaxIntervalMinutes);
  CHECK_THROWS_AS(Config::from_file("settings.ini"), std::runtime_error);
  CHECK_THROWS_AS(Config::from_file("missing_umon_cfg.json"),
                  std::runtime_error);

  Config cfg = Config::from_json(
      {{"storage", {{"history_retention_days", -4}}}, {"log_rotate", -1}});
  CHECK(cfg.history_retention_days() == 0);
  CHECK(cfg.log_rotate() == 0);
}
