#pragma once

#include <cstddef>

#include "config/config.pb.h"
#include "internal/raster/raster_types.hpp"

namespace soilhex::pipeline {

/*
  One clip → convert → index chain for a single raster layer.

  `slot` is the index of the result this task fills.
*/
struct LayerTask {
  soilhex::raster::RasterSource                  source;
  const soilhex::runtime::config::DatasetConfig* dataset = nullptr;
  size_t                                         slot    = 0;
};

} // namespace soilhex::pipeline
