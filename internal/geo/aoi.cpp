#include "aoi.hpp"

#include <cmath>

#include <fmt/format.h>

#include "internal/util/errors.hpp"

namespace soilhex::geo {

using soilhex::util::InvalidCoordinateError;
using soilhex::util::OutOfRegionError;

std::string Descriptor(const AreaOfInterest& aoi) {
  if (const auto* circle = std::get_if<Circle>(&aoi)) {
    return fmt::format("circle:{:.6f}:{:.6f}:{:.2f}", circle->center_lat, circle->center_lon, circle->radius_km);
  }
  return "full";
}

AreaOfInterest FromProto(const soilhex::runtime::config::AoiDescriptor& descriptor) {
  return Circle{descriptor.lat(), descriptor.lon(), descriptor.radius_km()};
}

AoiResolver::AoiResolver(soilhex::runtime::config::RegionConfig region) : region_(std::move(region)) {
}

std::string AoiResolver::BoundsDescription() const {
  return fmt::format("latitude {} to {}, longitude {} to {}", region_.min_lat(), region_.max_lat(), region_.min_lon(), region_.max_lon());
}

AreaOfInterest AoiResolver::Resolve(std::optional<double> lat, std::optional<double> lon, std::optional<double> radius_km) const {
  if (!lat && !lon) {
    if (radius_km) throw InvalidCoordinateError("a radius needs a center latitude and longitude");
    return FullExtent{};
  }
  if (!lat || !lon) {
    throw InvalidCoordinateError("latitude and longitude must be given together");
  }

  if (!std::isfinite(*lat) || *lat < -90.0 || *lat > 90.0) {
    throw InvalidCoordinateError(fmt::format("latitude {} outside -90 to 90", *lat));
  }
  if (!std::isfinite(*lon) || *lon < -180.0 || *lon > 180.0) {
    throw InvalidCoordinateError(fmt::format("longitude {} outside -180 to 180", *lon));
  }

  if (*lat < region_.min_lat() || *lat > region_.max_lat() || *lon < region_.min_lon() || *lon > region_.max_lon()) {
    throw OutOfRegionError(fmt::format("point ({}, {}) is outside the supported region: {}", *lat, *lon, BoundsDescription()));
  }

  const double radius = radius_km.value_or(region_.default_radius_km());
  if (!std::isfinite(radius) || radius <= 0.0 || radius < region_.min_radius_km() || radius > region_.max_radius_km()) {
    throw InvalidCoordinateError(fmt::format("radius {} km outside [{}, {}] km", radius, region_.min_radius_km(), region_.max_radius_km()));
  }

  return Circle{*lat, *lon, radius};
}

} // namespace soilhex::geo
