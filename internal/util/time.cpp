#include "time.hpp"

namespace assetxfer::util {

TimePoint Now() {
  return Clock::now();
}

Millis FromProto(const google::protobuf::Duration& duration, Millis fallback) {
  if (duration.seconds() == 0 && duration.nanos() == 0) {
    return fallback;
  }
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(duration.seconds()) + std::chrono::nanoseconds(duration.nanos()));
}

int64_t ElapsedMillis(TimePoint since) {
  return std::chrono::duration_cast<Millis>(Now() - since).count();
}

} // namespace assetxfer::util
