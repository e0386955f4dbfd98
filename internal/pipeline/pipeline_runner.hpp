#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/cache/pipeline_cache.hpp"
#include "internal/hex/hex_aggregator.hpp"
#include "internal/pipeline/layer_task.hpp"
#include "internal/pipeline/run_context.hpp"
#include "internal/scoring/suitability_scorer.hpp"

namespace soilhex::pipeline {

struct LayerReport {
  std::string                     layer;
  std::filesystem::path           path;
  soilhex::raster::Coverage       coverage;
  soilhex::table::ConversionStats stats;
  int64_t                         filtered_rows = 0;
  size_t                          rows          = 0;
};

struct RunSummary {
  std::string              aoi;
  int                      resolution = 0;
  std::vector<LayerReport> layers;
  std::vector<std::string> dropped_layers;  // empty clip on an optional dataset

  size_t  hex_count        = 0;
  size_t  boundaries_built = 0;
  size_t  scored           = 0;
  int64_t skipped          = 0;
  bool    aoi_touches_boundary = false;

  // keyed by cache family
  std::map<std::string, soilhex::cache::LookupCounts> cache_lookups;

  std::filesystem::path aggregates_csv;
  std::filesystem::path scores_csv;

  std::vector<soilhex::hex::HexAggregate> aggregates;
  soilhex::scoring::ScoreReport           report;
};

/*
  Discover → (clip → convert → index per layer, in parallel) → aggregate →
  boundaries → score → write.

  Each per-layer stage is wrapped by the cache. Failures are rethrown as
  StageError naming the stage and layer, except an empty clip on a dataset
  the scorer can default, which drops that layer.
*/
class PipelineRunner {
 public:
  explicit PipelineRunner(soilhex::runtime::config::RuntimeConfig config);

  RunSummary Run(const RunContext& ctx) const;

  soilhex::cache::SweepStats Sweep(const RunContext& ctx) const;
  soilhex::cache::SweepStats ClearCache(const RunContext& ctx, const std::string& family) const;

  // Single layer chain; exposed for tests and tooling.
  soilhex::hex::IndexedTable ProcessLayer(const RunContext& ctx, const soilhex::cache::PipelineCache& cache, const LayerTask& task) const;

 private:
  bool IsRequired(const std::string& dataset) const;

  soilhex::runtime::config::RuntimeConfig config_;
};

} // namespace soilhex::pipeline
