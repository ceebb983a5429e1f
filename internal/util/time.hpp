#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace framecomp::util {

/*
  Time utilities; the one place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMillis();

uint64_t ToUnixMillis(TimePoint tp);

// 0 maps to an unset timestamp.
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

} // namespace framecomp::util
