#include "backoff.hpp"

#include <algorithm>

namespace umon {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base,
                             std::chrono::milliseconds max)
    : base_(base), max_(std::max(base, max)) {}

std::chrono::milliseconds BackoffPolicy::on_rate_limited() {
  ++attempt_;
  return current_delay();
}

std::chrono::milliseconds BackoffPolicy::current_delay() const {
  if (attempt_ <= 0) {
    return std::chrono::milliseconds{0};
  }
  auto delay = base_;
  for (int i = 1; i < attempt_ && delay < max_; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_);
}

} // namespace umon
