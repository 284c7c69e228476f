#pragma once

#include <cstdint>
#include <string_view>

namespace mediacache::chunk {

// Lower value is more urgent.
enum class Priority : uint8_t {
  kCritical = 0,
  kHigh     = 1,
  kMedium   = 2,
  kLow      = 3,
};

inline bool MoreUrgent(Priority a, Priority b) {
  return static_cast<uint8_t>(a) < static_cast<uint8_t>(b);
}

inline std::string_view ToString(Priority p) {
  switch (p) {
    case Priority::kCritical:
      return "critical";
    case Priority::kHigh:
      return "high";
    case Priority::kMedium:
      return "medium";
    case Priority::kLow:
      return "low";
  }
  return "unknown";
}

} // namespace mediacache::chunk
