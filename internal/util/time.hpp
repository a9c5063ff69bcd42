#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace edgerun::util {

/*
  Wall-clock helpers. Execution timestamps and ids read the clock here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

int64_t ToUnixNanos(TimePoint tp);

} // namespace edgerun::util
