#pragma once

#include <optional>
#include <string>
#include <variant>

#include "config/config.pb.h"

namespace soilhex::geo {

struct FullExtent {
  bool operator==(const FullExtent&) const = default;
};

struct Circle {
  double center_lat = 0.0;
  double center_lon = 0.0;
  double radius_km  = 0.0;

  bool operator==(const Circle&) const = default;
};

/*
  Spatial scope of one pipeline run. Created once by AoiResolver and passed
  by const reference afterwards.
*/
using AreaOfInterest = std::variant<FullExtent, Circle>;

inline bool IsFullExtent(const AreaOfInterest& aoi) {
  return std::holds_alternative<FullExtent>(aoi);
}

/*
  Canonical text form used in cache keys and manifests:
      full
      circle:<lat>:<lon>:<radius_km>
  with lat/lon at 6 decimals and radius at 2.
*/
std::string Descriptor(const AreaOfInterest& aoi);

AreaOfInterest FromProto(const soilhex::runtime::config::AoiDescriptor& descriptor);

/*
  Validates user input against the configured region.

  Throws:
    InvalidCoordinateError  malformed or out-of-range coordinates / radius
    OutOfRegionError        center outside the region bounding box
*/
class AoiResolver {
 public:
  explicit AoiResolver(soilhex::runtime::config::RegionConfig region);

  AreaOfInterest Resolve(std::optional<double> lat, std::optional<double> lon, std::optional<double> radius_km = std::nullopt) const;

  std::string BoundsDescription() const;

 private:
  soilhex::runtime::config::RegionConfig region_;
};

} // namespace soilhex::geo
