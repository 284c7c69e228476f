#pragma once

#include <chrono>
#include <cstdint>

namespace mediacache::download {

struct RetryPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{30000};
  double                    multiplier = 2.0;

  // Delay after the given failed attempt (1-based).
  std::chrono::milliseconds BackoffAfter(uint32_t attempt) const;
};

} // namespace mediacache::download
