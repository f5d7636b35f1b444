#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace clusterlink::util {

/*
  Time utilities. Single place to control the clock source.

  Wall clock for anything that goes on the wire, steady clock for
  liveness bookkeeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using MonotonicClock     = std::chrono::steady_clock;
using MonotonicTimePoint = MonotonicClock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339, always UTC ("2025-03-10T12:00:00Z").
std::string ToIso8601(TimePoint tp);

// Falls back to `fallback` when the duration is unset or not positive.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace clusterlink::util
