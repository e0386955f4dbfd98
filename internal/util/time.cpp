#include "time.hpp"

namespace soilhex::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

int64_t FileMtimeNs(const std::filesystem::path& path) {
  const auto written = std::filesystem::last_write_time(path);
  return std::chrono::duration_cast<std::chrono::nanoseconds>(written.time_since_epoch()).count();
}

std::chrono::seconds FileAge(const std::filesystem::path& path) {
  const auto written = std::filesystem::last_write_time(path);
  return std::chrono::duration_cast<std::chrono::seconds>(std::filesystem::file_time_type::clock::now() - written);
}

} // namespace soilhex::util
