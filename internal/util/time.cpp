#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stateshift::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  return tm;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::string ToIso8601(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

TimePoint FromIso8601(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }
  return FromProto(ts);
}

std::string FileStamp(TimePoint tp) {
  const auto         tm = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return out.str();
}

std::string FileStampMicros(TimePoint tp) {
  const auto sec    = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();

  std::ostringstream out;
  out << FileStamp(sec) << '_' << std::setw(6) << std::setfill('0') << micros;
  return out.str();
}

std::int64_t VersionStamp(TimePoint tp) {
  const auto         tm = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d%H%M%S");
  return std::stoll(out.str());
}

} // namespace stateshift::util
