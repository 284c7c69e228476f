#include "time.hpp"

namespace mediacache::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

} // namespace mediacache::util
