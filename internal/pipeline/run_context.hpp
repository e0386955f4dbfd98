#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "config/config.pb.h"
#include "internal/geo/aoi.hpp"

namespace soilhex::pipeline {

/*
  Everything one run depends on. Built once from config and the user's AOI
  request and then passed explicitly; nothing about a run lives in globals,
  so several runs can proceed side by side in one process.
*/
struct RunContext {
  soilhex::geo::AreaOfInterest aoi;
  int                          resolution = 0;

  std::filesystem::path raster_dir;
  std::filesystem::path output_dir;
  std::filesystem::path cache_dir;

  soilhex::runtime::config::NodataPolicy nodata_policy = soilhex::runtime::config::NODATA_POLICY_SKIP;
  uint32_t                               worker_threads = 1;
  uint32_t                               min_points_per_hex = 0;
  bool                                   cache_enabled = true;
  bool                                   fsync         = false;

  // AOI descriptors the cache sweep keeps: full extent, allow-list, this run.
  std::set<std::string> protected_aois;

  static RunContext Build(const soilhex::runtime::config::RuntimeConfig& config, soilhex::geo::AreaOfInterest aoi,
                          std::optional<int> resolution = std::nullopt);
};

} // namespace soilhex::pipeline
