#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace umon;
using namespace std::chrono;

TEST_CASE("parse_rfc3339 handles UTC and offsets", "[time]") {
  auto utc = parse_rfc3339("2025-01-02T03:04:05Z");
  REQUIRE(utc);
  CHECK(duration_cast<seconds>(utc->time_since_epoch()).count() ==
        1735787045);

  auto offset = parse_rfc3339("2025-01-02T05:04:05+02:00");
  REQUIRE(offset);
  CHECK(*offset == *utc);

  auto fractional = parse_rfc3339("2025-01-02T03:04:05.250000+00:00");
  REQUIRE(fractional);
  CHECK(to_unix_millis(*fractional) == 1735787045250);
}

TEST_CASE("parse_rfc3339 rejects malformed input", "[time]") {
  CHECK_FALSE(parse_rfc3339(""));
  CHECK_FALSE(parse_rfc3339("not a timestamp"));
  CHECK_FALSE(parse_rfc3339("2025-01-02T03:04:05"));
  CHECK_FALSE(parse_rfc3339("2025-13-02T03:04:05Z"));
  CHECK_FALSE(parse_rfc3339("2025-01-02T03:04:05Zjunk"));
}

TEST_CASE("format_rfc3339 produces sortable UTC text", "[time]") {
  system_clock::time_point tp{milliseconds{1709249400123}};
  CHECK(format_rfc3339(tp) == "2024-02-29T23:30:00.123Z");
  auto back = parse_rfc3339(format_rfc3339(tp));
  REQUIRE(back);
  CHECK(to_unix_millis(*back) == 1709249400123);
}
