#include "usage_fetcher.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> fetcher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("fetcher");
  }();
  return logger;
}

FetchOutcome classify_status(const HttpResponse &response) {
  const long status = response.status_code;
  if (status == 401) {
    return FetchOutcome::failure(FetchError::Unauthorized, status,
                                 "session rejected");
  }
  if (status == 429) {
    return FetchOutcome::failure(FetchError::RateLimited, status,
                                 "rate limited");
  }
  return FetchOutcome::failure(FetchError::ServerError, status,
                               "HTTP " + std::to_string(status));
}

} // namespace

const char *to_string(FetchError error) {
  switch (error) {
  case FetchError::Unauthorized:
    return "unauthorized";
  case FetchError::RateLimited:
    return "rate_limited";
  case FetchError::ServerError:
    return "server_error";
  case FetchError::Network:
    return "network";
  case FetchError::ParseError:
    return "parse_error";
  }
  return "unknown";
}

bool is_retryable(FetchError error) {
  return error != FetchError::Unauthorized;
}

std::string describe(FetchError error, long status) {
  switch (error) {
  case FetchError::Unauthorized:
    return "Session expired. Please update your session token.";
  case FetchError::RateLimited:
    return "Rate limited. Retrying automatically.";
  case FetchError::ServerError:
    return "Server error (HTTP " + std::to_string(status) + ").";
  case FetchError::Network:
    return "Network error. Check your internet connection.";
  case FetchError::ParseError:
    return "Unexpected response from the usage API.";
  }
  return "Unknown error.";
}

FetchOutcome FetchOutcome::success(UsageSnapshot snapshot) {
  FetchOutcome outcome;
  outcome.snapshot_ = std::move(snapshot);
  return outcome;
}

FetchOutcome FetchOutcome::failure(FetchError error, long status,
                                   std::string detail) {
  FetchOutcome outcome;
  outcome.error_ = error;
  outcome.status_ = status;
  outcome.detail_ = std::move(detail);
  return outcome;
}

UsageFetcher::UsageFetcher(std::unique_ptr<HttpClient> http,
                           std::string api_base, std::string user_agent)
    : http_(std::move(http)), api_base_(std::move(api_base)),
      user_agent_(std::move(user_agent)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
  if (!http_) {
    throw std::invalid_argument("UsageFetcher requires an HTTP client");
  }
}

std::string UsageFetcher::usage_url(const std::string &organization_id) const {
  return api_base_ + "/api/organizations/" + organization_id + "/usage";
}

/**
 * Perform one usage request and classify the result.
 *
 * @param organization_id Organization whose usage is requested.
 * @param session_token Session cookie value.
 * @return Snapshot on HTTP 2xx with a valid body, otherwise a failure.
 */
FetchOutcome UsageFetcher::fetch(const std::string &organization_id,
                                 const std::string &session_token) {
  const std::string url = usage_url(organization_id);
  std::vector<std::string> headers = {
      "Accept: application/json",
      "User-Agent: " + user_agent_,
      "Cookie: sessionKey=" + session_token,
  };
  fetcher_log()->debug("Fetching usage for org {} (token {})",
                       organization_id, mask_secret(session_token));
  HttpResponse response;
  try {
    response = http_->get(url, headers);
  } catch (const TransientNetworkError &e) {
    fetcher_log()->warn("Usage request failed: {}", e.what());
    return FetchOutcome::failure(FetchError::Network, 0, e.what());
  } catch (const std::exception &e) {
    fetcher_log()->error("Usage request failed unexpectedly: {}", e.what());
    return FetchOutcome::failure(FetchError::Network, 0, e.what());
  }

  if (response.status_code < 200 || response.status_code >= 300) {
    auto outcome = classify_status(response);
    fetcher_log()->warn("Usage request returned HTTP {} ({})",
                        response.status_code, to_string(outcome.error()));
    return outcome;
  }

  try {
    auto body = nlohmann::json::parse(response.body);
    auto snapshot = UsageSnapshot::from_json(body);
    fetcher_log()->debug("Usage fetched for org {}", organization_id);
    return FetchOutcome::success(std::move(snapshot));
  } catch (const std::exception &e) {
    fetcher_log()->warn("Failed to parse usage response: {}", e.what());
    return FetchOutcome::failure(FetchError::ParseError, response.status_code,
                                 e.what());
  }
}

} // namespace umon
