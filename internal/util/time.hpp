#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace assetxfer::util {

/*
  Time utilities, the single place that picks the clock source.

  Deadlines and backoff use the monotonic clock; wall time never enters a
  retry or poll decision.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

TimePoint Now();

// Returns `fallback` when the proto duration is unset or zero.
Millis FromProto(const google::protobuf::Duration& duration, Millis fallback);

int64_t ElapsedMillis(TimePoint since);

} // namespace assetxfer::util
