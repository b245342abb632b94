#include "validation.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace umon {

namespace {

constexpr std::size_t kMaxOrgIdLength = 128;
constexpr std::size_t kMaxTokenLength = 4096;

bool is_org_char(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_';
}

bool is_token_char(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '+' ||
         c == '/' || c == '=';
}

} // namespace

void validate_org_id(const std::string &org_id) {
  if (org_id.empty()) {
    throw ValidationError("organization_id", "Organization ID is required");
  }
  if (org_id.size() > kMaxOrgIdLength) {
    throw ValidationError("organization_id", "Organization ID is too long");
  }
  if (!std::all_of(org_id.begin(), org_id.end(),
                   [](char c) { return is_org_char(c); })) {
    throw ValidationError("organization_id",
                          "Organization ID contains invalid characters");
  }
}

void validate_session_token(const std::string &token) {
  if (token.empty()) {
    throw ValidationError("session_token", "Session token is required");
  }
  if (token.size() > kMaxTokenLength) {
    throw ValidationError("session_token", "Session token is too long");
  }
  if (!std::all_of(token.begin(), token.end(),
                   [](char c) { return is_token_char(c); })) {
    throw ValidationError("session_token",
                          "Session token contains invalid characters");
  }
}

} // namespace umon
