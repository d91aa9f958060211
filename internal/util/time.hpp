#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace gigbook::util {

/*
  Time utilities. Single place to control the clock source.

  Stored timestamps carry millisecond precision so that a value survives
  a JSON round trip unchanged.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);
int64_t  ToUnixMillis(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp FromUnixMillis(int64_t ms);

// Current time truncated to milliseconds.
google::protobuf::Timestamp NowProto();

// RFC 3339 / ISO-8601 in UTC, e.g. 2024-05-01T20:15:00.125Z
std::string ToIso8601(const google::protobuf::Timestamp& ts);

} // namespace gigbook::util
