#include "table_converter.hpp"

#include <cmath>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/raster/gdal_dataset.hpp"

namespace soilhex::table {

using soilhex::observability::IntField;
using soilhex::observability::StringField;
using soilhex::runtime::config::NODATA_POLICY_NAN;

PointCursor::PointCursor(const soilhex::raster::ClippedRaster& clipped, UnitConverter converter, soilhex::runtime::config::NodataPolicy policy)
    : grid_(clipped.grid), converter_(std::move(converter)), policy_(policy) {
  auto srs = soilhex::raster::SpatialReferenceFromWkt(grid_.crs_wkt);
  if (!srs.IsGeographic()) {
    to_wgs84_ = std::make_unique<soilhex::raster::CoordinateTransform>(srs, soilhex::raster::Wgs84());
  }
}

PointCursor::~PointCursor() = default;

void PointCursor::Reset() {
  row_   = -1;
  col_   = 0;
  stats_ = ConversionStats{};
}

void PointCursor::LoadRow(int32_t row) {
  row_lon_.resize(grid_.width);
  row_lat_.resize(grid_.width);
  for (int32_t col = 0; col < grid_.width; ++col) {
    row_lon_[col] = grid_.CenterX(col, row);
    row_lat_[col] = grid_.CenterY(col, row);
  }
  if (to_wgs84_) {
    to_wgs84_->Transform(row_lon_, row_lat_);
  }
  row_ = row;
  col_ = 0;
}

std::optional<PointRecord> PointCursor::Next() {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  while (true) {
    if (row_ < 0 || col_ >= grid_.width) {
      const int32_t next_row = row_ + 1;
      if (next_row >= grid_.height || grid_.width == 0) return std::nullopt;
      LoadRow(next_row);
    }

    const int32_t col = col_++;
    const double  raw = grid_.At(col, row_);
    ++stats_.total_pixels;

    PointRecord record{row_lon_[col], row_lat_[col], kNaN};

    if (grid_.IsNodata(raw)) {
      ++stats_.nodata_pixels;
      if (policy_ != NODATA_POLICY_NAN) continue;
      ++stats_.emitted;
      return record;
    }

    const double converted = converter_.Apply(raw);
    if (!converter_.Plausible(converted)) {
      ++stats_.anomalous_values;
      if (policy_ != NODATA_POLICY_NAN) continue;
      ++stats_.emitted;
      return record;
    }

    record.value = converted;
    ++stats_.emitted;
    return record;
  }
}

TableConverter::TableConverter(soilhex::runtime::config::NodataPolicy policy) : policy_(policy) {
}

PointTable TableConverter::ToTable(const soilhex::raster::ClippedRaster& clipped, const soilhex::raster::RasterSource& source,
                                   const soilhex::runtime::config::DatasetConfig& dataset) const {
  UnitConverter converter(dataset.conversion());

  PointTable table;
  table.layer    = source.Layer();
  table.unit     = converter.unit();
  table.coverage = clipped.coverage;

  const auto expected = static_cast<size_t>(clipped.coverage.valid_pixels);
  table.lon.reserve(expected);
  table.lat.reserve(expected);
  table.value.reserve(expected);

  PointCursor cursor(clipped, std::move(converter), policy_);
  while (auto record = cursor.Next()) table.Append(*record);
  table.stats = cursor.stats();

  if (table.stats.anomalous_values > 0) {
    SOILHEX_LOG_WARN("Implausible values after unit conversion",
                     {StringField("layer", table.layer), StringField("unit", table.unit), IntField("anomalous", table.stats.anomalous_values)});
  }
  SOILHEX_LOG_DEBUG("Converted raster to table", {StringField("layer", table.layer), IntField("total", table.stats.total_pixels),
                                                  IntField("nodata", table.stats.nodata_pixels), IntField("emitted", table.stats.emitted)});
  return table;
}

} // namespace soilhex::table
