#include "internal/pipeline/pipeline_runner.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/pipeline/run_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/raster_fixtures.hpp"

namespace {

namespace fs = std::filesystem;

using soilhex::geo::Circle;
using soilhex::geo::FullExtent;
using soilhex::pipeline::PipelineRunner;
using soilhex::pipeline::RunContext;
using soilhex::scoring::Grade;

struct Layout {
  fs::path                                root;
  soilhex::runtime::config::RuntimeConfig config;
};

/*
  Degraded soil everywhere: dry, low carbon, acidic, hot. Every hex should
  come out at 77.78.
*/
Layout DegradedSoil(const std::string& name) {
  Layout layout;
  layout.root = soilhex::testing::FreshDir(name);

  const auto rasters = layout.root / "raw";
  fs::create_directories(rasters);
  soilhex::testing::WriteConstant(rasters / "soil_moisture_res_250.tif", 0.15f);
  soilhex::testing::WriteConstant(rasters / "soil_temp_res_250.tif", 305.15f);
  soilhex::testing::WriteConstant(rasters / "SOC_res_250_b0.tif", 6.0f);
  soilhex::testing::WriteConstant(rasters / "SOC_res_250_b10.tif", 10.0f);
  soilhex::testing::WriteConstant(rasters / "soil_pH_res_250_b0.tif", 50.0f);
  soilhex::testing::WriteConstant(rasters / "soil_pH_res_250_b10.tif", 50.0f);

  layout.config = soilhex::config::ConfigLoader::Defaults();
  auto* data    = layout.config.mutable_data();
  data->set_raster_dir(rasters.string());
  data->set_output_dir((layout.root / "processed").string());
  data->set_cache_dir((layout.root / "cache").string());
  layout.config.mutable_processing()->set_worker_threads(3);
  return layout;
}

size_t CountManifests(const fs::path& dir) {
  size_t count = 0;
  if (!fs::is_directory(dir)) return 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".manifest.json") != std::string::npos) ++count;
  }
  return count;
}

std::string FirstLine(const fs::path& path) {
  std::ifstream in(path);
  std::string   line;
  std::getline(in, line);
  return line;
}

std::string ReadBytes(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::vector<std::string> OutputBytes(const fs::path& processed) {
  return {ReadBytes(processed / "hex_aggregates.csv"), ReadBytes(processed / "hex_aggregates.arrow"),
          ReadBytes(processed / "suitability_scores.csv"), ReadBytes(processed / "suitability_scores.arrow")};
}

void TestCircleRunScoresEveryHex() {
  auto       layout = DegradedSoil("pipeline_circle");
  const auto ctx    = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});
  const auto summary = PipelineRunner(layout.config).Run(ctx);

  assert(summary.resolution == 7);
  assert(summary.layers.size() == 6);
  assert(summary.dropped_layers.empty());
  assert(!summary.aoi_touches_boundary);
  assert(summary.hex_count > 10);
  assert(summary.boundaries_built == summary.hex_count);
  assert(summary.scored == summary.hex_count);
  assert(summary.skipped == 0);

  for (const auto& layer : summary.layers) {
    assert(layer.rows > 200);
    assert(layer.coverage.fraction_valid == 1.0);
    assert(layer.filtered_rows == 0);
  }

  for (const auto& agg : summary.aggregates) {
    assert(std::fabs(agg.mean.at("soil_ph@b0") - 5.0) < 1e-5);
    assert(std::fabs(agg.mean.at("soil_organic_carbon@b10") - 1.0) < 1e-5);
  }
  for (const auto& score : summary.report.scores) {
    assert(std::fabs(score.composite - 77.78) < 1e-9);
    assert(score.grade == Grade::kHigh);
    assert(!score.fallback_used);
  }

  assert(fs::exists(summary.aggregates_csv));
  assert(fs::exists(summary.scores_csv));
  assert(fs::exists(layout.root / "processed" / "suitability_scores.arrow"));
  assert(FirstLine(summary.scores_csv).find("suitability_grade") != std::string::npos);
  assert(FirstLine(summary.aggregates_csv).find("soil_ph_b0_count") != std::string::npos);

  const auto cache = layout.root / "cache";
  assert(CountManifests(cache / "clip") == 6);
  assert(CountManifests(cache / "table") == 6);
  assert(CountManifests(cache / "hex_index") == 6);
}

void TestRerunIsServedFromCacheWithSameResult() {
  auto       layout = DegradedSoil("pipeline_rerun");
  const auto ctx    = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});

  const auto first = PipelineRunner(layout.config).Run(ctx);

  // the clip entries are never consulted when the index entry hits
  soilhex::pipeline::PipelineRunner(layout.config).ClearCache(ctx, "clip");
  const auto second = PipelineRunner(layout.config).Run(ctx);

  assert(CountManifests(layout.root / "cache" / "clip") == 0);
  assert(second.hex_count == first.hex_count);
  assert(second.layers.size() == first.layers.size());
  for (size_t i = 0; i < first.layers.size(); ++i) {
    assert(second.layers[i].rows == first.layers[i].rows);
    assert(second.layers[i].coverage.valid_pixels == first.layers[i].coverage.valid_pixels);
    assert(second.layers[i].stats.total_pixels == first.layers[i].stats.total_pixels);
  }
  for (size_t i = 0; i < first.report.scores.size(); ++i) {
    assert(second.report.scores[i].cell == first.report.scores[i].cell);
    assert(second.report.scores[i].composite == first.report.scores[i].composite);
  }
}

void TestWarmRerunWritesIdenticalOutputs() {
  auto       layout    = DegradedSoil("pipeline_warm_rerun");
  const auto ctx       = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});
  const auto processed = layout.root / "processed";

  const auto cold       = PipelineRunner(layout.config).Run(ctx);
  const auto cold_bytes = OutputBytes(processed);
  assert(cold.cache_lookups.at("hex_index").misses == 6);
  assert(cold.cache_lookups.at("clip").misses == 6);

  const auto warm = PipelineRunner(layout.config).Run(ctx);
  assert(OutputBytes(processed) == cold_bytes);
  for (const auto& bytes : cold_bytes) assert(!bytes.empty());

  // every layer is served by its index entry; nothing below it is consulted
  const auto& index = warm.cache_lookups.at("hex_index");
  assert(index.hits == 6);
  assert(index.misses == 0 && index.stale == 0 && index.corrupt == 0);
  assert(warm.cache_lookups.count("table") == 0);
  assert(warm.cache_lookups.count("clip") == 0);
}

void TestTouchedRasterRecomputesOnlyItsLayer() {
  auto       layout = DegradedSoil("pipeline_touch");
  const auto ctx    = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});
  PipelineRunner(layout.config).Run(ctx);

  const auto touched = layout.root / "raw" / "soil_temp_res_250.tif";
  fs::last_write_time(touched, fs::last_write_time(touched) + std::chrono::hours(1));

  const auto rerun = PipelineRunner(layout.config).Run(ctx);
  const auto& index = rerun.cache_lookups.at("hex_index");
  assert(index.hits == 5);
  assert(index.stale == 1);
  assert(rerun.cache_lookups.at("table").stale == 1);
  assert(rerun.cache_lookups.at("table").hits == 0);
  assert(rerun.cache_lookups.at("clip").stale == 1);
  assert(rerun.cache_lookups.at("clip").hits == 0);

  // stale entries are replaced in their slots
  const auto cache = layout.root / "cache";
  assert(CountManifests(cache / "clip") == 6);
  assert(CountManifests(cache / "table") == 6);
  assert(CountManifests(cache / "hex_index") == 6);

  const auto settled = PipelineRunner(layout.config).Run(ctx);
  assert(settled.cache_lookups.at("hex_index").hits == 6);
}

void TestLargeCircleFlagsBoundary() {
  auto       layout  = DegradedSoil("pipeline_boundary");
  const auto ctx     = RunContext::Build(layout.config, Circle{-13.0, -56.0, 40.0});
  const auto summary = PipelineRunner(layout.config).Run(ctx);

  assert(summary.aoi_touches_boundary);
  for (const auto& layer : summary.layers) {
    assert(layer.coverage.touches_boundary);
    assert(layer.coverage.fraction_valid < 1.0);
  }
  assert(summary.scored > 0);
}

void TestFullExtentSkipsClipCache() {
  auto       layout  = DegradedSoil("pipeline_full");
  const auto ctx     = RunContext::Build(layout.config, FullExtent{});
  const auto summary = PipelineRunner(layout.config).Run(ctx);

  assert(summary.resolution == 5);
  assert(summary.aoi == "full");
  assert(summary.layers[0].rows == 1600);
  assert(summary.scored == summary.hex_count);
  assert(CountManifests(layout.root / "cache" / "clip") == 0);
  assert(CountManifests(layout.root / "cache" / "table") == 6);
}

void TestEmptyOptionalLayerIsDropped() {
  auto layout = DegradedSoil("pipeline_drop_optional");
  soilhex::testing::WriteConstant(layout.root / "raw" / "soil_moisture_res_250.tif", -9999.0f);

  const auto ctx     = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});
  const auto summary = PipelineRunner(layout.config).Run(ctx);

  assert(summary.dropped_layers.size() == 1);
  assert(summary.dropped_layers[0] == "soil_moisture");
  assert(summary.layers.size() == 5);
  for (const auto& score : summary.report.scores) {
    assert(score.fallback_used);
    assert(score.properties[0].value == 50.0);
  }
}

void TestEmptyRequiredLayerFailsTheRun() {
  auto layout = DegradedSoil("pipeline_required_empty");
  soilhex::testing::WriteConstant(layout.root / "raw" / "soil_pH_res_250_b0.tif", -9999.0f);

  const auto ctx = RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0});

  bool threw = false;
  try {
    PipelineRunner(layout.config).Run(ctx);
  } catch (const soilhex::util::StageError& e) {
    threw = true;
    assert(e.stage() == "clip");
    assert(e.dataset() == "soil_ph@b0");
  }
  assert(threw);
}

void TestSweepKeepsProtectedAoisOnly() {
  auto layout = DegradedSoil("pipeline_sweep");

  const PipelineRunner runner(layout.config);
  runner.Run(RunContext::Build(layout.config, Circle{-13.0, -56.0, 10.0}));
  runner.Run(RunContext::Build(layout.config, Circle{-13.05, -56.05, 5.0}));

  const auto cache = layout.root / "cache";
  assert(CountManifests(cache / "hex_index") == 12);

  // protects the configured allow-list, full extent and the 5 km circle
  const auto stats = runner.Sweep(RunContext::Build(layout.config, Circle{-13.05, -56.05, 5.0}));
  assert(stats.entries_removed == 18);
  assert(CountManifests(cache / "hex_index") == 6);
  assert(CountManifests(cache / "clip") == 6);
}

} // namespace

int main() {
  TestCircleRunScoresEveryHex();
  TestRerunIsServedFromCacheWithSameResult();
  TestWarmRerunWritesIdenticalOutputs();
  TestTouchedRasterRecomputesOnlyItsLayer();
  TestLargeCircleFlagsBoundary();
  TestFullExtentSkipsClipCache();
  TestEmptyOptionalLayerIsDropped();
  TestEmptyRequiredLayerFailsTheRun();
  TestSweepKeepsProtectedAoisOnly();

  std::cout << "soilhex_integration_pipeline: pass\n";
  return 0;
}
