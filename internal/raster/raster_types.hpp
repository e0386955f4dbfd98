#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace soilhex::raster {

/*
  One input layer on disk. Read-only once discovered.
*/
struct RasterSource {
  std::string           dataset;
  std::string           depth_band;  // empty when the dataset has no depth bands
  std::filesystem::path path;
  int64_t               mtime_ns = 0;
  uint64_t              size     = 0;
  std::string           resolution_tag;

  // dataset or dataset@band
  std::string Layer() const {
    return depth_band.empty() ? dataset : dataset + "@" + depth_band;
  }
};

/*
  Single band, row-major float32 pixels with a GDAL-style affine transform:
      x = gt[0] + col * gt[1] + row * gt[2]
      y = gt[3] + col * gt[4] + row * gt[5]
*/
struct RasterGrid {
  int32_t               width  = 0;
  int32_t               height = 0;
  std::array<double, 6> geotransform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
  std::string           crs_wkt;
  std::optional<double> nodata;
  std::vector<float>    values;

  float At(int32_t col, int32_t row) const {
    return values[static_cast<size_t>(row) * static_cast<size_t>(width) + static_cast<size_t>(col)];
  }

  double CenterX(int32_t col, int32_t row) const {
    return geotransform[0] + (col + 0.5) * geotransform[1] + (row + 0.5) * geotransform[2];
  }

  double CenterY(int32_t col, int32_t row) const {
    return geotransform[3] + (col + 0.5) * geotransform[4] + (row + 0.5) * geotransform[5];
  }

  // Non-finite values are always nodata. Finite nodata uses a 1 ppm relative tolerance.
  bool IsNodata(double value) const {
    if (!std::isfinite(value)) return true;
    if (!nodata || std::isnan(*nodata)) return false;
    const double eps = 1e-6 * std::max({1.0, std::fabs(value), std::fabs(*nodata)});
    return std::fabs(value - *nodata) <= eps;
  }

  float FillValue() const {
    return nodata && std::isfinite(*nodata) ? static_cast<float>(*nodata) : std::nanf("");
  }
};

struct Coverage {
  double  fraction_valid   = 0.0;
  bool    touches_boundary = false;
  int64_t valid_pixels     = 0;
  int64_t footprint_pixels = 0;
};

struct ClippedRaster {
  RasterGrid grid;
  Coverage   coverage;
};

} // namespace soilhex::raster
