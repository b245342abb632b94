#include "errors.hpp"
#include "usage_fetcher.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace umon;

namespace {

class ScriptedHttpClient : public HttpClient {
public:
  struct Shared {
    std::string last_url;
    std::vector<std::string> last_headers;
    int calls = 0;
  };

  ScriptedHttpClient(std::shared_ptr<Shared> shared, long status,
                     std::string body, bool transport_failure = false)
      : shared_(std::move(shared)), status_(status), body_(std::move(body)),
        transport_failure_(transport_failure) {}

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    ++shared_->calls;
    shared_->last_url = url;
    shared_->last_headers = headers;
    if (transport_failure_) {
      throw TransientNetworkError("connection refused");
    }
    return {body_, {}, status_};
  }

private:
  std::shared_ptr<Shared> shared_;
  long status_;
  std::string body_;
  bool transport_failure_;
};

FetchOutcome fetch_with(long status, const std::string &body,
                        bool transport_failure = false,
                        std::shared_ptr<ScriptedHttpClient::Shared> shared =
                            std::make_shared<ScriptedHttpClient::Shared>()) {
  UsageFetcher fetcher(std::make_unique<ScriptedHttpClient>(
                           shared, status, body, transport_failure),
                       "https://claude.ai/", "usagemonitor/test");
  return fetcher.fetch("org-1", "token-abc");
}

bool has_header(const std::vector<std::string> &headers,
                const std::string &header) {
  return std::find(headers.begin(), headers.end(), header) != headers.end();
}

} // namespace

TEST_CASE("fetcher sends session cookie and client identifier", "[fetcher]") {
  auto shared = std::make_shared<ScriptedHttpClient::Shared>();
  auto outcome =
      fetch_with(200, R"({"five_hour":{"utilization":5,"resets_at":null}})",
                 false, shared);
  REQUIRE(outcome.ok());
  CHECK(shared->calls == 1);
  CHECK(shared->last_url ==
        "https://claude.ai/api/organizations/org-1/usage");
  CHECK(has_header(shared->last_headers, "Cookie: sessionKey=token-abc"));
  CHECK(has_header(shared->last_headers, "User-Agent: usagemonitor/test"));
}

TEST_CASE("fetcher keeps absent dimensions absent", "[fetcher]") {
  auto outcome = fetch_with(
      200, R"({"five_hour":{"utilization":33.3,"resets_at":"2025-01-01T00:00:00Z"},
              "seven_day":null})");
  REQUIRE(outcome.ok());
  REQUIRE(outcome.snapshot().five_hour());
  CHECK(outcome.snapshot().five_hour()->utilization == 33.3);
  CHECK_FALSE(outcome.snapshot().seven_day());
  CHECK_FALSE(outcome.snapshot().seven_day_sonnet());
  CHECK_FALSE(outcome.snapshot().seven_day_opus());
}

TEST_CASE("fetcher maps HTTP statuses to error kinds", "[fetcher]") {
  auto unauthorized = fetch_with(401, "{}");
  REQUIRE_FALSE(unauthorized.ok());
  CHECK(unauthorized.error() == FetchError::Unauthorized);
  CHECK(unauthorized.message() ==
        "Session expired. Please update your session token.");
  CHECK_FALSE(is_retryable(unauthorized.error()));

  auto limited = fetch_with(429, "slow down");
  CHECK(limited.error() == FetchError::RateLimited);
  CHECK(is_retryable(limited.error()));

  auto server = fetch_with(503, "unavailable");
  CHECK(server.error() == FetchError::ServerError);
  CHECK(server.status() == 503);
  CHECK(server.message() == "Server error (HTTP 503).");

  auto forbidden = fetch_with(403, "{}");
  CHECK(forbidden.error() == FetchError::ServerError);
  CHECK(forbidden.status() == 403);
}

TEST_CASE("fetcher maps transport and parse failures", "[fetcher]") {
  auto network = fetch_with(0, "", true);
  REQUIRE_FALSE(network.ok());
  CHECK(network.error() == FetchError::Network);

  auto garbage = fetch_with(200, "<html>login</html>");
  REQUIRE_FALSE(garbage.ok());
  CHECK(garbage.error() == FetchError::ParseError);

  auto wrong_shape = fetch_with(200, R"({"five_hour":{"utilization":"x"}})");
  CHECK(wrong_shape.error() == FetchError::ParseError);
}

TEST_CASE("fetcher requires a transport", "[fetcher]") {
  CHECK_THROWS_AS(UsageFetcher(nullptr, "https://claude.ai", "ua"),
                  std::invalid_argument);
}
