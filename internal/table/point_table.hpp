#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/raster/raster_types.hpp"

namespace soilhex::table {

struct PointRecord {
  double lon   = 0.0;
  double lat   = 0.0;
  double value = 0.0;
};

struct ConversionStats {
  int64_t total_pixels     = 0;
  int64_t nodata_pixels    = 0;
  int64_t anomalous_values = 0;
  int64_t emitted          = 0;
};

/*
  Columnar point records for one layer (dataset + depth band).
  Coordinates are WGS84 lon/lat at pixel centres.
*/
struct PointTable {
  std::string         layer;
  std::string         unit;
  std::vector<double> lon;
  std::vector<double> lat;
  std::vector<double> value;
  ConversionStats     stats;

  // Coverage of the clip the points came from.
  soilhex::raster::Coverage coverage;

  size_t size() const {
    return value.size();
  }

  void Append(const PointRecord& record) {
    lon.push_back(record.lon);
    lat.push_back(record.lat);
    value.push_back(record.value);
  }
};

} // namespace soilhex::table
