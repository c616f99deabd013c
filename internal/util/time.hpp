#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace roster::util {

/*
  Time utilities. Plans carry their creation time as a
  google.protobuf.Timestamp, which prints as RFC 3339 in JSON.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Millisecond precision; plan files never carry finer timestamps.
google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::uint64_t ToUnixMillis(TimePoint tp);

// Wall-clock milliseconds elapsed since `start`, for progress logs.
std::int64_t MillisSince(TimePoint start);

} // namespace roster::util
