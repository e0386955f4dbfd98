#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "config/config.pb.h"
#include "internal/raster/raster_types.hpp"
#include "internal/table/point_table.hpp"
#include "internal/table/unit_converter.hpp"

namespace soilhex::raster {
class CoordinateTransform;
}

namespace soilhex::table {

/*
  Lazily walks a clipped raster in row-major order and yields point records.

  Pixel centres are reprojected to WGS84 one row at a time when the raster is
  not already geographic. Reset() restarts the walk and clears the stats.
*/
class PointCursor {
 public:
  PointCursor(const soilhex::raster::ClippedRaster& clipped, UnitConverter converter, soilhex::runtime::config::NodataPolicy policy);
  ~PointCursor();

  PointCursor(const PointCursor&)            = delete;
  PointCursor& operator=(const PointCursor&) = delete;

  std::optional<PointRecord> Next();
  void                       Reset();

  const ConversionStats& stats() const {
    return stats_;
  }

 private:
  void LoadRow(int32_t row);

  const soilhex::raster::RasterGrid&                    grid_;
  UnitConverter                                         converter_;
  soilhex::runtime::config::NodataPolicy                policy_;
  std::unique_ptr<soilhex::raster::CoordinateTransform> to_wgs84_;

  int32_t             row_ = -1;
  int32_t             col_ = 0;
  std::vector<double> row_lon_;
  std::vector<double> row_lat_;
  ConversionStats     stats_;
};

/*
  Flattens a clipped raster into a PointTable.
*/
class TableConverter {
 public:
  explicit TableConverter(soilhex::runtime::config::NodataPolicy policy);

  PointTable ToTable(const soilhex::raster::ClippedRaster& clipped, const soilhex::raster::RasterSource& source,
                     const soilhex::runtime::config::DatasetConfig& dataset) const;

 private:
  soilhex::runtime::config::NodataPolicy policy_;
};

} // namespace soilhex::table
