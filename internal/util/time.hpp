#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace stateshift::util {

/*
  Time utilities. Every clock read goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339 / ISO-8601, UTC ("2025-01-01T00:00:00Z").
std::string ToIso8601(TimePoint tp);

// Throws std::invalid_argument on malformed input.
TimePoint FromIso8601(const std::string& text);

// Compact UTC stamp used in generated file names, e.g. "20250101_000000".
std::string FileStamp(TimePoint tp);

// FileStamp() plus microseconds, e.g. "20250101_000000_000250".
std::string FileStampMicros(TimePoint tp);

// Migration version derived from a timestamp, e.g. 20250101000000.
std::int64_t VersionStamp(TimePoint tp);

} // namespace stateshift::util
