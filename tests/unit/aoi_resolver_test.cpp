#include "internal/geo/aoi.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using soilhex::geo::AoiResolver;
using soilhex::geo::Circle;
using soilhex::geo::FullExtent;

AoiResolver DefaultResolver() {
  return AoiResolver(soilhex::config::ConfigLoader::Defaults().region());
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestNoCoordinatesMeansFullExtent() {
  const auto aoi = DefaultResolver().Resolve(std::nullopt, std::nullopt);
  assert(soilhex::geo::IsFullExtent(aoi));
  assert(soilhex::geo::Descriptor(aoi) == "full");
}

void TestCircleUsesDefaultRadius() {
  const auto aoi = DefaultResolver().Resolve(-13.0, -56.0);
  assert(std::get<Circle>(aoi) == (Circle{-13.0, -56.0, 100.0}));
  assert(soilhex::geo::Descriptor(aoi) == "circle:-13.000000:-56.000000:100.00");

  const auto custom = DefaultResolver().Resolve(-13.0, -56.0, 25.5);
  assert(std::get<Circle>(custom).radius_km == 25.5);
}

void TestRegionBoundsAreInclusive() {
  const auto resolver = DefaultResolver();
  assert(!soilhex::geo::IsFullExtent(resolver.Resolve(-18.0, -62.0)));
  assert(!soilhex::geo::IsFullExtent(resolver.Resolve(-7.0, -50.0)));
}

void TestOutsideRegionIsRejected() {
  const auto resolver = DefaultResolver();
  assert(Throws<soilhex::util::OutOfRegionError>([&] { resolver.Resolve(-20.0, -56.0); }));
  assert(Throws<soilhex::util::OutOfRegionError>([&] { resolver.Resolve(-13.0, -49.9); }));
}

void TestMalformedInputIsRejected() {
  const auto resolver = DefaultResolver();
  const auto nan      = std::numeric_limits<double>::quiet_NaN();

  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, std::nullopt); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(std::nullopt, -56.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(nan, -56.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-95.0, -56.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, 181.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, -56.0, 0.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, -56.0, -5.0); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, -56.0, 500.1); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(-13.0, -56.0, 0.5); }));
  assert(Throws<soilhex::util::InvalidCoordinateError>([&] { resolver.Resolve(std::nullopt, std::nullopt, 25.0); }));
}

void TestMaxRadiusIsAccepted() {
  const auto aoi = DefaultResolver().Resolve(-13.0, -56.0, 500.0);
  assert(std::get<Circle>(aoi).radius_km == 500.0);
  assert(std::get<Circle>(DefaultResolver().Resolve(-13.0, -56.0, 1.0)).radius_km == 1.0);

  auto region = soilhex::config::ConfigLoader::Defaults().region();
  region.set_min_radius_km(0.0);
  assert(std::get<Circle>(AoiResolver(region).Resolve(-13.0, -56.0, 0.5)).radius_km == 0.5);
}

void TestProtoDescriptorRoundTrip() {
  soilhex::runtime::config::AoiDescriptor descriptor;
  descriptor.set_lat(-13.0);
  descriptor.set_lon(-56.0);
  descriptor.set_radius_km(100.0);
  assert(soilhex::geo::Descriptor(soilhex::geo::FromProto(descriptor)) == "circle:-13.000000:-56.000000:100.00");
  assert(soilhex::geo::FullExtent{} == FullExtent{});
}

} // namespace

int main() {
  TestNoCoordinatesMeansFullExtent();
  TestCircleUsesDefaultRadius();
  TestRegionBoundsAreInclusive();
  TestOutsideRegionIsRejected();
  TestMalformedInputIsRejected();
  TestMaxRadiusIsAccepted();
  TestProtoDescriptorRoundTrip();

  std::cout << "soilhex_unit_aoi_resolver: pass\n";
  return 0;
}
