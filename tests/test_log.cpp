#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>

TEST_CASE("parse_log_level accepts known names", "[log]") {
  CHECK(umon::parse_log_level("debug") == spdlog::level::debug);
  CHECK(umon::parse_log_level("WARNING") == spdlog::level::warn);
  CHECK(umon::parse_log_level("off") == spdlog::level::off);
  CHECK_THROWS_AS(umon::parse_log_level("loud"), std::invalid_argument);
}

TEST_CASE("mask_secret keeps only the last four characters", "[log]") {
  CHECK(umon::mask_secret("sk-ant-sid01-abcdef") == "****cdef");
  CHECK(umon::mask_secret("abc") == "***");
  CHECK(umon::mask_secret("").empty());
}

TEST_CASE("category loggers share the file sink", "[log]") {
  const char *path = "test_umon.log";
  std::remove(path);
  umon::init_logger(spdlog::level::info, "", path);
  auto fetcher = umon::category_logger("fetcher");
  CHECK(fetcher->name() == "umon.fetcher");
  CHECK(umon::category_logger("fetcher") == fetcher);
  umon::configure_log_categories({{"fetcher", spdlog::level::debug}});
  fetcher->debug("fetcher debug message");
  spdlog::debug("root debug message");
  spdlog::info("root info message");
  spdlog::shutdown();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  CHECK(content.find("root info message") != std::string::npos);
  CHECK(content.find("fetcher debug message") != std::string::npos);
  CHECK(content.find("root debug message") == std::string::npos);
  f.close();
  std::remove(path);
}
