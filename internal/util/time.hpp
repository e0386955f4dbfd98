#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "google/protobuf/timestamp.pb.h"

namespace soilhex::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// Nanoseconds since the file clock's epoch. Only compared against itself.
int64_t FileMtimeNs(const std::filesystem::path& path);

// Age of a file's last write relative to now.
std::chrono::seconds FileAge(const std::filesystem::path& path);

} // namespace soilhex::util
