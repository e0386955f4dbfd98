#include "artifact_codec.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/type.h>
#include <arrow/util/key_value_metadata.h>

#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace soilhex::cache {

using soilhex::storage::common::Unwrap;
using soilhex::util::CacheCorruptionError;

namespace {

using Metadata = std::vector<std::pair<std::string, std::string>>;

std::string Num(double value) {
  return fmt::format("{}", value);
}

std::shared_ptr<arrow::KeyValueMetadata> ToArrow(const Metadata& metadata) {
  std::vector<std::string> keys, values;
  for (const auto& [k, v] : metadata) {
    keys.push_back(k);
    values.push_back(v);
  }
  return arrow::key_value_metadata(keys, values);
}

std::string Get(const std::shared_ptr<arrow::RecordBatch>& batch, const std::string& key) {
  const auto& metadata = batch->schema()->metadata();
  if (!metadata) throw CacheCorruptionError("artifact has no metadata");
  auto value = metadata->Get(key);
  if (!value.ok()) throw CacheCorruptionError("artifact metadata missing " + key);
  return *value;
}

double GetDouble(const std::shared_ptr<arrow::RecordBatch>& batch, const std::string& key) {
  try {
    return std::stod(Get(batch, key));
  } catch (const std::logic_error&) {
    throw CacheCorruptionError("artifact metadata " + key + " is not numeric");
  }
}

int64_t GetInt(const std::shared_ptr<arrow::RecordBatch>& batch, const std::string& key) {
  try {
    return std::stoll(Get(batch, key));
  } catch (const std::logic_error&) {
    throw CacheCorruptionError("artifact metadata " + key + " is not an integer");
  }
}

template <typename ArrayType>
std::shared_ptr<ArrayType> Column(const std::shared_ptr<arrow::RecordBatch>& batch, const std::string& name) {
  auto column = batch->GetColumnByName(name);
  if (!column) throw CacheCorruptionError("artifact missing column " + name);
  auto typed = std::dynamic_pointer_cast<ArrayType>(column);
  if (!typed) throw CacheCorruptionError("artifact column " + name + " has unexpected type");
  if (typed->null_count() > 0) throw CacheCorruptionError("artifact column " + name + " contains nulls");
  return typed;
}

template <typename Builder, typename T>
std::shared_ptr<arrow::Array> BuildArray(const std::vector<T>& values) {
  Builder builder;
  Unwrap(builder.AppendValues(values));
  return Unwrap(builder.Finish());
}

template <typename ArrayType, typename T>
std::vector<T> ToVector(const std::shared_ptr<ArrayType>& array) {
  return std::vector<T>(array->raw_values(), array->raw_values() + array->length());
}

void PutCoverage(Metadata& metadata, const soilhex::raster::Coverage& coverage) {
  metadata.emplace_back("fraction_valid", Num(coverage.fraction_valid));
  metadata.emplace_back("touches_boundary", coverage.touches_boundary ? "1" : "0");
  metadata.emplace_back("valid_pixels", std::to_string(coverage.valid_pixels));
  metadata.emplace_back("footprint_pixels", std::to_string(coverage.footprint_pixels));
}

soilhex::raster::Coverage GetCoverage(const std::shared_ptr<arrow::RecordBatch>& batch) {
  soilhex::raster::Coverage coverage;
  coverage.fraction_valid   = GetDouble(batch, "fraction_valid");
  coverage.touches_boundary = Get(batch, "touches_boundary") == "1";
  coverage.valid_pixels     = GetInt(batch, "valid_pixels");
  coverage.footprint_pixels = GetInt(batch, "footprint_pixels");
  return coverage;
}

void PutStats(Metadata& metadata, const soilhex::table::ConversionStats& stats) {
  metadata.emplace_back("total_pixels", std::to_string(stats.total_pixels));
  metadata.emplace_back("nodata_pixels", std::to_string(stats.nodata_pixels));
  metadata.emplace_back("anomalous_values", std::to_string(stats.anomalous_values));
  metadata.emplace_back("emitted", std::to_string(stats.emitted));
}

soilhex::table::ConversionStats GetStats(const std::shared_ptr<arrow::RecordBatch>& batch) {
  soilhex::table::ConversionStats stats;
  stats.total_pixels     = GetInt(batch, "total_pixels");
  stats.nodata_pixels    = GetInt(batch, "nodata_pixels");
  stats.anomalous_values = GetInt(batch, "anomalous_values");
  stats.emitted          = GetInt(batch, "emitted");
  return stats;
}

Metadata PointMetadata(const soilhex::table::PointTable& table) {
  Metadata metadata{{"layer", table.layer}, {"unit", table.unit}};
  PutStats(metadata, table.stats);
  PutCoverage(metadata, table.coverage);
  return metadata;
}

soilhex::table::PointTable DecodePoints(const std::shared_ptr<arrow::RecordBatch>& batch) {
  soilhex::table::PointTable table;
  table.layer = Get(batch, "layer");
  table.unit  = Get(batch, "unit");
  table.stats    = GetStats(batch);
  table.coverage = GetCoverage(batch);
  table.lon   = ToVector<arrow::DoubleArray, double>(Column<arrow::DoubleArray>(batch, "lon"));
  table.lat   = ToVector<arrow::DoubleArray, double>(Column<arrow::DoubleArray>(batch, "lat"));
  table.value = ToVector<arrow::DoubleArray, double>(Column<arrow::DoubleArray>(batch, "value"));
  return table;
}

} // namespace

// ------------------------------------------------------------
// Clipped raster
// ------------------------------------------------------------

std::shared_ptr<arrow::RecordBatch> ArtifactCodec<soilhex::raster::ClippedRaster>::Encode(const soilhex::raster::ClippedRaster& clipped) {
  const auto& grid = clipped.grid;

  std::ostringstream gt;
  for (size_t i = 0; i < grid.geotransform.size(); ++i) gt << (i ? "," : "") << Num(grid.geotransform[i]);

  Metadata metadata{
      {"width", std::to_string(grid.width)},
      {"height", std::to_string(grid.height)},
      {"geotransform", gt.str()},
      {"crs_wkt", grid.crs_wkt},
      {"nodata", grid.nodata ? Num(*grid.nodata) : ""},
  };
  PutCoverage(metadata, clipped.coverage);

  auto schema = arrow::schema({arrow::field("value", arrow::float32(), false)}, ToArrow(metadata));
  return arrow::RecordBatch::Make(schema, static_cast<int64_t>(grid.values.size()), {BuildArray<arrow::FloatBuilder>(grid.values)});
}

soilhex::raster::ClippedRaster ArtifactCodec<soilhex::raster::ClippedRaster>::Decode(const std::shared_ptr<arrow::RecordBatch>& batch) {
  soilhex::raster::ClippedRaster clipped;
  auto&                          grid = clipped.grid;

  grid.width   = static_cast<int32_t>(GetInt(batch, "width"));
  grid.height  = static_cast<int32_t>(GetInt(batch, "height"));
  grid.crs_wkt = Get(batch, "crs_wkt");

  std::istringstream gt(Get(batch, "geotransform"));
  std::string        part;
  size_t             i = 0;
  while (std::getline(gt, part, ',')) {
    if (i >= grid.geotransform.size()) throw CacheCorruptionError("artifact geotransform has too many terms");
    try {
      grid.geotransform[i++] = std::stod(part);
    } catch (const std::logic_error&) {
      throw CacheCorruptionError("artifact geotransform is not numeric");
    }
  }
  if (i != grid.geotransform.size()) throw CacheCorruptionError("artifact geotransform has too few terms");

  if (const auto nodata = Get(batch, "nodata"); !nodata.empty()) grid.nodata = GetDouble(batch, "nodata");

  clipped.coverage = GetCoverage(batch);

  grid.values = ToVector<arrow::FloatArray, float>(Column<arrow::FloatArray>(batch, "value"));
  if (grid.values.size() != static_cast<size_t>(grid.width) * static_cast<size_t>(grid.height)) {
    throw CacheCorruptionError("artifact pixel count does not match grid size");
  }
  return clipped;
}

// ------------------------------------------------------------
// Point table
// ------------------------------------------------------------

std::shared_ptr<arrow::RecordBatch> ArtifactCodec<soilhex::table::PointTable>::Encode(const soilhex::table::PointTable& table) {
  auto schema = arrow::schema({arrow::field("lon", arrow::float64(), false), arrow::field("lat", arrow::float64(), false),
                               arrow::field("value", arrow::float64(), false)},
                              ToArrow(PointMetadata(table)));
  return arrow::RecordBatch::Make(schema, static_cast<int64_t>(table.size()),
                                  {BuildArray<arrow::DoubleBuilder>(table.lon), BuildArray<arrow::DoubleBuilder>(table.lat),
                                   BuildArray<arrow::DoubleBuilder>(table.value)});
}

soilhex::table::PointTable ArtifactCodec<soilhex::table::PointTable>::Decode(const std::shared_ptr<arrow::RecordBatch>& batch) {
  return DecodePoints(batch);
}

// ------------------------------------------------------------
// Indexed table
// ------------------------------------------------------------

std::shared_ptr<arrow::RecordBatch> ArtifactCodec<soilhex::hex::IndexedTable>::Encode(const soilhex::hex::IndexedTable& indexed) {
  auto metadata = PointMetadata(indexed.points);
  metadata.emplace_back("resolution", std::to_string(indexed.resolution));
  metadata.emplace_back("filtered_rows", std::to_string(indexed.filtered_rows));

  auto schema = arrow::schema({arrow::field("lon", arrow::float64(), false), arrow::field("lat", arrow::float64(), false),
                               arrow::field("value", arrow::float64(), false), arrow::field("cell", arrow::uint64(), false)},
                              ToArrow(metadata));
  return arrow::RecordBatch::Make(schema, static_cast<int64_t>(indexed.points.size()),
                                  {BuildArray<arrow::DoubleBuilder>(indexed.points.lon), BuildArray<arrow::DoubleBuilder>(indexed.points.lat),
                                   BuildArray<arrow::DoubleBuilder>(indexed.points.value), BuildArray<arrow::UInt64Builder>(indexed.cells)});
}

soilhex::hex::IndexedTable ArtifactCodec<soilhex::hex::IndexedTable>::Decode(const std::shared_ptr<arrow::RecordBatch>& batch) {
  soilhex::hex::IndexedTable indexed;
  indexed.points        = DecodePoints(batch);
  indexed.resolution    = static_cast<int>(GetInt(batch, "resolution"));
  indexed.filtered_rows = GetInt(batch, "filtered_rows");
  indexed.cells         = ToVector<arrow::UInt64Array, uint64_t>(Column<arrow::UInt64Array>(batch, "cell"));
  return indexed;
}

} // namespace soilhex::cache
