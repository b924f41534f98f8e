#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace auklet::util {

/*
  Time utilities. Every timestamp in the process comes from Clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// RFC3339, UTC ("2024-05-01T12:00:00.250Z").
std::string ToRfc3339(TimePoint tp);

} // namespace auklet::util
