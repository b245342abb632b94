#include "backoff.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace umon;
using namespace std::chrono;

TEST_CASE("backoff doubles up to the cap", "[backoff]") {
  BackoffPolicy policy(seconds(30), seconds(300));
  CHECK_FALSE(policy.active());
  CHECK(policy.current_delay() == milliseconds{0});
  CHECK(policy.on_rate_limited() == seconds(30));
  CHECK(policy.on_rate_limited() == seconds(60));
  CHECK(policy.on_rate_limited() == seconds(120));
  CHECK(policy.on_rate_limited() == seconds(240));
  CHECK(policy.on_rate_limited() == seconds(300));
  CHECK(policy.on_rate_limited() == seconds(300));
  CHECK(policy.attempt() == 6);
}

TEST_CASE("backoff delays never decrease", "[backoff]") {
  BackoffPolicy policy(milliseconds(7), milliseconds(1000));
  milliseconds previous{0};
  for (int i = 0; i < 64; ++i) {
    auto delay = policy.on_rate_limited();
    CHECK(delay >= previous);
    CHECK(delay <= milliseconds(1000));
    previous = delay;
  }
}

TEST_CASE("reset clears the attempt counter", "[backoff]") {
  BackoffPolicy policy(milliseconds(10), milliseconds(100));
  policy.on_rate_limited();
  policy.on_rate_limited();
  policy.reset();
  CHECK(policy.attempt() == 0);
  CHECK(policy.on_rate_limited() == milliseconds(10));
}
