#include "time.hpp"

namespace roster::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto ms    = std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(ms);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ms - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<std::int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                   std::chrono::nanoseconds(ts.nanos()));
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::int64_t MillisSince(TimePoint start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Now() - start).count();
}

} // namespace roster::util
