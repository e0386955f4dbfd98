#include "gdal_dataset.hpp"

#include <cpl_conv.h>
#include <gdal.h>

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace soilhex::raster {

using soilhex::util::RasterReadError;

void EnsureGdalRegistered() {
  static std::once_flag once;
  std::call_once(once, [] { GDALAllRegister(); });
}

GdalDataset GdalDataset::Open(const std::string& path) {
  EnsureGdalRegistered();

  auto* dataset = static_cast<GDALDataset*>(GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
  if (dataset == nullptr) {
    throw RasterReadError("failed to open raster " + path + ": " + CPLGetLastErrorMsg());
  }
  if (dataset->GetRasterCount() < 1) {
    GDALClose(static_cast<GDALDatasetH>(dataset));
    throw RasterReadError("raster has no bands: " + path);
  }
  return GdalDataset(dataset, path);
}

GdalDataset::GdalDataset(GDALDataset* dataset, std::string path) : dataset_(dataset), path_(std::move(path)) {
}

GdalDataset::~GdalDataset() {
  if (dataset_) {
    GDALClose(static_cast<GDALDatasetH>(dataset_));
  }
}

GdalDataset::GdalDataset(GdalDataset&& other) noexcept : dataset_(std::exchange(other.dataset_, nullptr)), path_(std::move(other.path_)) {
}

GdalDataset& GdalDataset::operator=(GdalDataset&& other) noexcept {
  if (this != &other) {
    if (dataset_) {
      GDALClose(static_cast<GDALDatasetH>(dataset_));
    }
    dataset_ = std::exchange(other.dataset_, nullptr);
    path_    = std::move(other.path_);
  }
  return *this;
}

int32_t GdalDataset::Width() const {
  return dataset_->GetRasterXSize();
}

int32_t GdalDataset::Height() const {
  return dataset_->GetRasterYSize();
}

std::array<double, 6> GdalDataset::GeoTransform() const {
  std::array<double, 6> gt{};
  if (dataset_->GetGeoTransform(gt.data()) != CE_None) {
    throw RasterReadError("raster has no geotransform: " + path_);
  }
  if (gt[2] != 0.0 || gt[4] != 0.0) {
    throw RasterReadError("rotated geotransforms are not supported: " + path_);
  }
  return gt;
}

std::string GdalDataset::ProjectionWkt() const {
  const char* projref = dataset_->GetProjectionRef();
  if (projref && projref[0] != '\0') {
    return projref;
  }

  char* wkt = nullptr;
  Wgs84().exportToWkt(&wkt);
  std::string result(wkt ? wkt : "");
  CPLFree(wkt);
  return result;
}

std::optional<double> GdalDataset::NoData(int band) const {
  int          has_nodata = FALSE;
  const double value      = dataset_->GetRasterBand(band)->GetNoDataValue(&has_nodata);
  if (!has_nodata) return std::nullopt;
  return value;
}

std::vector<float> GdalDataset::ReadWindow(int band, int32_t col, int32_t row, int32_t width, int32_t height) const {
  std::vector<float> data(static_cast<size_t>(width) * static_cast<size_t>(height));
  if (data.empty()) return data;

  const CPLErr err =
      dataset_->GetRasterBand(band)->RasterIO(GF_Read, col, row, width, height, data.data(), width, height, GDT_Float32, 0, 0, nullptr);
  if (err != CE_None) {
    throw RasterReadError("RasterIO failed for " + path_ + ": " + CPLGetLastErrorMsg());
  }
  return data;
}

// ------------------------------------------------------------
// Spatial references
// ------------------------------------------------------------

OGRSpatialReference SpatialReferenceFromWkt(const std::string& wkt) {
  OGRSpatialReference srs;
  if (srs.importFromWkt(wkt.c_str()) != OGRERR_NONE) {
    throw RasterReadError("invalid CRS definition");
  }
  srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  return srs;
}

OGRSpatialReference Wgs84() {
  OGRSpatialReference srs;
  srs.SetWellKnownGeogCS("WGS84");
  srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  return srs;
}

CoordinateTransform::CoordinateTransform(const OGRSpatialReference& source, const OGRSpatialReference& target)
    : transform_(OGRCreateCoordinateTransformation(&source, &target)) {
  if (!transform_) {
    throw RasterReadError(std::string("failed to create coordinate transform: ") + CPLGetLastErrorMsg());
  }
}

void CoordinateTransform::Transform(std::vector<double>& xs, std::vector<double>& ys) const {
  std::vector<int> success(xs.size(), FALSE);
  if (!transform_->Transform(xs.size(), xs.data(), ys.data(), nullptr, success.data())) {
    throw RasterReadError("coordinate transform failed");
  }
  for (int ok : success) {
    if (!ok) throw RasterReadError("coordinate transform failed for one or more points");
  }
}

} // namespace soilhex::raster
