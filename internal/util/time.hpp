#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace mediacache::util {

/*
  Time utilities. Records store unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMs();

uint64_t ToUnixMillis(TimePoint tp);

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

} // namespace mediacache::util
