#include "internal/download/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace mediacache::download {

std::chrono::milliseconds RetryPolicy::BackoffAfter(uint32_t attempt) const {
  if (attempt == 0) return std::chrono::milliseconds(0);

  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, static_cast<double>(attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

} // namespace mediacache::download
