#pragma once

#include <arrow/record_batch.h>

#include <memory>

#include "internal/hex/hex_indexer.hpp"
#include "internal/raster/raster_types.hpp"
#include "internal/table/point_table.hpp"

namespace soilhex::cache {

/*
  Arrow record batch encoding for each cached artifact type. Scalars travel
  in schema metadata. Decode throws CacheCorruptionError on anything
  malformed.
*/
template <typename T>
struct ArtifactCodec;

template <>
struct ArtifactCodec<soilhex::raster::ClippedRaster> {
  static std::shared_ptr<arrow::RecordBatch> Encode(const soilhex::raster::ClippedRaster& clipped);
  static soilhex::raster::ClippedRaster      Decode(const std::shared_ptr<arrow::RecordBatch>& batch);
};

template <>
struct ArtifactCodec<soilhex::table::PointTable> {
  static std::shared_ptr<arrow::RecordBatch> Encode(const soilhex::table::PointTable& table);
  static soilhex::table::PointTable          Decode(const std::shared_ptr<arrow::RecordBatch>& batch);
};

template <>
struct ArtifactCodec<soilhex::hex::IndexedTable> {
  static std::shared_ptr<arrow::RecordBatch> Encode(const soilhex::hex::IndexedTable& indexed);
  static soilhex::hex::IndexedTable          Decode(const std::shared_ptr<arrow::RecordBatch>& batch);
};

} // namespace soilhex::cache
