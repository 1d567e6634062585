#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace normbalance::util {

/*
  Clock helpers shared by reports and logs.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// Milliseconds elapsed on the steady clock since `start`.
double ElapsedMillis(std::chrono::steady_clock::time_point start);

} // namespace normbalance::util
