#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace ledgersync::util {

/*
  Time utilities. Single place to control the clock source.

  Components take a NowFn so tests can drive time explicitly.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.000Z
std::string FormatMillis(uint64_t ms);

} // namespace ledgersync::util
