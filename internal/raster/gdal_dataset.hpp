#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gdal_priv.h>
#include <ogr_spatialref.h>

namespace soilhex::raster {

// Registers GDAL drivers once per process.
void EnsureGdalRegistered();

/*
  RAII wrapper around a read-only GDALDataset.
*/
class GdalDataset {
 public:
  static GdalDataset Open(const std::string& path);

  ~GdalDataset();

  GdalDataset(const GdalDataset&)            = delete;
  GdalDataset& operator=(const GdalDataset&) = delete;

  GdalDataset(GdalDataset&& other) noexcept;
  GdalDataset& operator=(GdalDataset&& other) noexcept;

  int32_t Width() const;
  int32_t Height() const;

  std::array<double, 6> GeoTransform() const;

  // Raster CRS as WKT. Datasets without one are treated as WGS84.
  std::string ProjectionWkt() const;

  std::optional<double> NoData(int band = 1) const;

  // Reads a window of band `band` as float32. Window must lie inside the raster.
  std::vector<float> ReadWindow(int band, int32_t col, int32_t row, int32_t width, int32_t height) const;

  const std::string& path() const {
    return path_;
  }

 private:
  GdalDataset(GDALDataset* dataset, std::string path);

  GDALDataset* dataset_ = nullptr;
  std::string  path_;
};

/*
  Owning OGRCoordinateTransformation with traditional lon/lat axis order.
*/
class CoordinateTransform {
 public:
  CoordinateTransform(const OGRSpatialReference& source, const OGRSpatialReference& target);

  // In-place transform; throws RasterReadError if any point fails.
  void Transform(std::vector<double>& xs, std::vector<double>& ys) const;

 private:
  struct Deleter {
    void operator()(OGRCoordinateTransformation* transform) const {
      OGRCoordinateTransformation::DestroyCT(transform);
    }
  };

  std::unique_ptr<OGRCoordinateTransformation, Deleter> transform_;
};

OGRSpatialReference SpatialReferenceFromWkt(const std::string& wkt);
OGRSpatialReference Wgs84();

} // namespace soilhex::raster
