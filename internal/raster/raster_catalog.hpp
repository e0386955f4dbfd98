#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/raster/raster_types.hpp"

namespace soilhex::raster {

/*
  Finds the GeoTIFF layers for each configured dataset in the raster
  directory.

  A file belongs to the first dataset whose keyword occurs in its stem. For
  datasets with depth bands the stem must end in `_<band>`. When a file
  exists in both the fine and coarse resolution variants, only the fine one
  is kept.
*/
class RasterCatalog {
 public:
  explicit RasterCatalog(soilhex::runtime::config::DataConfig config);

  // Sorted by dataset order in the config, then band, then path.
  std::vector<RasterSource> Discover() const;

  // Re-reads mtime and size from disk.
  static RasterSource Describe(RasterSource source);

 private:
  soilhex::runtime::config::DataConfig config_;
};

} // namespace soilhex::raster
