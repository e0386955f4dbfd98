#include "raster_clipper.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

#include "internal/observability/logging.hpp"
#include "internal/raster/gdal_dataset.hpp"
#include "internal/util/errors.hpp"

namespace soilhex::raster {

using soilhex::observability::BoolField;
using soilhex::observability::DoubleField;
using soilhex::observability::IntField;
using soilhex::observability::StringField;
using soilhex::util::EmptyClipError;

RasterClipper::RasterClipper(int ring_vertices) : ring_vertices_(std::max(16, ring_vertices)) {
}

bool PointInRing(const std::vector<std::pair<double, double>>& ring, double x, double y) {
  bool inside = false;
  for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
    const auto [xi, yi] = ring[i];
    const auto [xj, yj] = ring[j];
    if ((yi > y) != (yj > y) && x < (xj - xi) * (y - yi) / (yj - yi) + xi) {
      inside = !inside;
    }
  }
  return inside;
}

std::vector<std::pair<double, double>> RasterClipper::BufferRing(const soilhex::geo::Circle& circle, const std::string& target_wkt) const {
  OGRSpatialReference aeqd;
  aeqd.SetWellKnownGeogCS("WGS84");
  aeqd.SetAE(circle.center_lat, circle.center_lon, 0.0, 0.0);
  aeqd.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

  const double radius_m = circle.radius_km * 1000.0;

  std::vector<double> xs(ring_vertices_ + 1);
  std::vector<double> ys(ring_vertices_ + 1);
  for (int i = 0; i < ring_vertices_; ++i) {
    const double theta = 2.0 * std::numbers::pi * i / ring_vertices_;
    xs[i]              = radius_m * std::sin(theta);
    ys[i]              = radius_m * std::cos(theta);
  }
  xs[ring_vertices_] = xs[0];
  ys[ring_vertices_] = ys[0];

  CoordinateTransform(aeqd, SpatialReferenceFromWkt(target_wkt)).Transform(xs, ys);

  std::vector<std::pair<double, double>> ring;
  ring.reserve(xs.size());
  for (size_t i = 0; i < xs.size(); ++i) ring.emplace_back(xs[i], ys[i]);
  return ring;
}

ClippedRaster RasterClipper::Clip(const RasterSource& source, const soilhex::geo::AreaOfInterest& aoi) const {
  if (const auto* circle = std::get_if<soilhex::geo::Circle>(&aoi)) {
    return ClipCircle(source, *circle);
  }
  return ClipFull(source);
}

ClippedRaster RasterClipper::ClipFull(const RasterSource& source) const {
  auto dataset = GdalDataset::Open(source.path.string());

  ClippedRaster out;
  out.grid.width        = dataset.Width();
  out.grid.height       = dataset.Height();
  out.grid.geotransform = dataset.GeoTransform();
  out.grid.crs_wkt      = dataset.ProjectionWkt();
  out.grid.nodata       = dataset.NoData();
  out.grid.values       = dataset.ReadWindow(1, 0, 0, out.grid.width, out.grid.height);

  int64_t valid = 0;
  for (float v : out.grid.values) {
    if (!out.grid.IsNodata(v)) ++valid;
  }

  out.coverage.footprint_pixels = static_cast<int64_t>(out.grid.values.size());
  out.coverage.valid_pixels     = valid;
  out.coverage.fraction_valid   = out.grid.values.empty() ? 0.0 : static_cast<double>(valid) / out.grid.values.size();

  if (valid == 0) {
    throw EmptyClipError("raster " + source.path.string() + " contains no valid pixels");
  }
  return out;
}

ClippedRaster RasterClipper::ClipCircle(const RasterSource& source, const soilhex::geo::Circle& circle) const {
  auto dataset = GdalDataset::Open(source.path.string());

  const auto gt     = dataset.GeoTransform();
  const auto wkt    = dataset.ProjectionWkt();
  const auto ring   = BufferRing(circle, wkt);
  const int  width  = dataset.Width();
  const int  height = dataset.Height();

  double min_x = std::numeric_limits<double>::infinity(), max_x = -min_x;
  double min_y = min_x, max_y = -min_x;
  for (const auto& [x, y] : ring) {
    min_x = std::min(min_x, x);
    max_x = std::max(max_x, x);
    min_y = std::min(min_y, y);
    max_y = std::max(max_y, y);
  }

  // Buffer bounding box on the raster's (unbounded) pixel lattice.
  const double px_a = (min_x - gt[0]) / gt[1], px_b = (max_x - gt[0]) / gt[1];
  const double py_a = (min_y - gt[3]) / gt[5], py_b = (max_y - gt[3]) / gt[5];
  const auto   col0 = static_cast<int64_t>(std::floor(std::min(px_a, px_b)));
  const auto   col1 = static_cast<int64_t>(std::floor(std::max(px_a, px_b)));
  const auto   row0 = static_cast<int64_t>(std::floor(std::min(py_a, py_b)));
  const auto   row1 = static_cast<int64_t>(std::floor(std::max(py_a, py_b)));

  // Intersection with the raster extent.
  const auto win_col0 = static_cast<int32_t>(std::clamp<int64_t>(col0, 0, width));
  const auto win_col1 = static_cast<int32_t>(std::clamp<int64_t>(col1 + 1, 0, width));
  const auto win_row0 = static_cast<int32_t>(std::clamp<int64_t>(row0, 0, height));
  const auto win_row1 = static_cast<int32_t>(std::clamp<int64_t>(row1 + 1, 0, height));

  ClippedRaster out;
  out.grid.width        = win_col1 - win_col0;
  out.grid.height       = win_row1 - win_row0;
  out.grid.crs_wkt      = wkt;
  out.grid.nodata       = dataset.NoData();
  out.grid.geotransform = {gt[0] + win_col0 * gt[1], gt[1], 0.0, gt[3] + win_row0 * gt[5], 0.0, gt[5]};
  out.grid.values       = dataset.ReadWindow(1, win_col0, win_row0, out.grid.width, out.grid.height);

  const float fill = out.grid.FillValue();
  auto&       cov  = out.coverage;

  for (int64_t row = row0; row <= row1; ++row) {
    const double y = gt[3] + (row + 0.5) * gt[5];
    for (int64_t col = col0; col <= col1; ++col) {
      const double x = gt[0] + (col + 0.5) * gt[1];
      const bool   in_buffer = PointInRing(ring, x, y);
      const bool   in_raster = col >= 0 && col < width && row >= 0 && row < height;

      if (in_buffer) {
        ++cov.footprint_pixels;
        if (!in_raster) cov.touches_boundary = true;
      }
      if (!in_raster) continue;

      float& value = out.grid.values[static_cast<size_t>(row - win_row0) * out.grid.width + static_cast<size_t>(col - win_col0)];
      if (!in_buffer) {
        value = fill;
      } else if (!out.grid.IsNodata(value)) {
        ++cov.valid_pixels;
      }
    }
  }

  cov.fraction_valid = cov.footprint_pixels == 0 ? 0.0 : static_cast<double>(cov.valid_pixels) / cov.footprint_pixels;

  if (cov.valid_pixels == 0) {
    throw EmptyClipError("AOI " + soilhex::geo::Descriptor(circle) + " has no valid pixels in " + source.path.string());
  }

  if (cov.touches_boundary) {
    SOILHEX_LOG_WARN("AOI extends beyond raster extent",
                     {StringField("layer", source.Layer()), DoubleField("fraction_valid", cov.fraction_valid),
                      IntField("valid_pixels", cov.valid_pixels), BoolField("touches_boundary", true)});
  }
  return out;
}

} // namespace soilhex::raster
