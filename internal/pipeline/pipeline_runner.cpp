#include "pipeline_runner.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/layer_scheduler.hpp"
#include "internal/pipeline/layer_worker.hpp"
#include "internal/pipeline/output_writer.hpp"
#include "internal/raster/raster_catalog.hpp"
#include "internal/raster/raster_clipper.hpp"
#include "internal/table/table_converter.hpp"
#include "internal/util/errors.hpp"

namespace soilhex::pipeline {

using soilhex::observability::BoolField;
using soilhex::observability::DoubleField;
using soilhex::observability::IntField;
using soilhex::observability::Metrics;
using soilhex::observability::SpanScope;
using soilhex::observability::StringField;
using soilhex::util::StageError;

namespace {

/*
  Times one stage and records it in the span and stage metrics.
*/
template <typename Fn>
auto TimedStage(const std::string& stage, Fn&& fn) {
  SpanScope  span("soilhex." + stage);
  const auto start = std::chrono::steady_clock::now();
  auto       done  = [&](bool success) {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    Metrics::Instance().RecordStage(stage, success);
    Metrics::Instance().ObserveStageDurationMs(stage, elapsed);
  };

  try {
    auto result = fn();
    done(true);
    return result;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    done(false);
    throw;
  }
}

std::string PolicyName(soilhex::runtime::config::NodataPolicy policy) {
  return soilhex::runtime::config::NodataPolicy_Name(policy);
}

} // namespace

PipelineRunner::PipelineRunner(soilhex::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

bool PipelineRunner::IsRequired(const std::string& dataset) const {
  for (const auto& property : config_.scoring().properties()) {
    if (property.dataset() == dataset) return property.required();
  }
  return false;
}

soilhex::hex::IndexedTable PipelineRunner::ProcessLayer(const RunContext& ctx, const soilhex::cache::PipelineCache& cache,
                                                        const LayerTask& task) const {
  const auto& source    = task.source;
  const auto  aoi       = soilhex::geo::Descriptor(ctx.aoi);
  const auto  policy    = PolicyName(ctx.nodata_policy);
  const auto  conversion = soilhex::runtime::config::UnitConversion_Name(task.dataset->conversion());

  soilhex::cache::CacheKeyInputs clip_inputs{soilhex::cache::kClipFamily, "clip", {source}, aoi, {}};
  soilhex::cache::CacheKeyInputs table_inputs{soilhex::cache::kTableFamily, "to_table", {source}, aoi, {{"nodata_policy", policy}, {"unit", conversion}}};
  soilhex::cache::CacheKeyInputs index_inputs{soilhex::cache::kIndexFamily,
                                              "hex_index",
                                              {source},
                                              aoi,
                                              {{"nodata_policy", policy}, {"unit", conversion}, {"resolution", std::to_string(ctx.resolution)}}};

  const soilhex::raster::RasterClipper clipper;
  const soilhex::table::TableConverter converter(ctx.nodata_policy);
  const soilhex::hex::HexIndexer       indexer(ctx.resolution);

  std::string stage = "hex_index";
  try {
    return cache.GetOrCompute<soilhex::hex::IndexedTable>(index_inputs, [&] {
      stage      = "to_table";
      auto table = cache.GetOrCompute<soilhex::table::PointTable>(table_inputs, [&] {
        stage             = "clip";
        auto clip_compute = [&] { return TimedStage("clip", [&] { return clipper.Clip(source, ctx.aoi); }); };
        // Full extent is a pass-through; caching a copy of the raster buys nothing.
        auto clipped = soilhex::geo::IsFullExtent(ctx.aoi) ? clip_compute()
                                                            : cache.GetOrCompute<soilhex::raster::ClippedRaster>(clip_inputs, clip_compute);
        stage = "to_table";
        return TimedStage("to_table", [&] { return converter.ToTable(clipped, source, *task.dataset); });
      });
      stage = "hex_index";
      return TimedStage("hex_index", [&] { return indexer.Index(std::move(table)); });
    });
  } catch (const soilhex::util::EmptyClipError&) {
    throw;
  } catch (const std::exception& e) {
    throw StageError(stage, source.Layer(), e.what());
  }
}

RunSummary PipelineRunner::Run(const RunContext& ctx) const {
  SpanScope span("soilhex.run");
  span.SetAttribute("aoi", soilhex::geo::Descriptor(ctx.aoi));
  span.SetAttribute("resolution", static_cast<int64_t>(ctx.resolution));

  RunSummary summary;
  summary.aoi        = soilhex::geo::Descriptor(ctx.aoi);
  summary.resolution = ctx.resolution;

  SOILHEX_LOG_INFO("Pipeline run started", {StringField("aoi", summary.aoi), IntField("resolution", ctx.resolution)});

  // ------------------------------------------------------------
  // Discover
  // ------------------------------------------------------------
  auto data = config_.data();
  data.set_raster_dir(ctx.raster_dir.string());
  const auto sources = soilhex::raster::RasterCatalog(data).Discover();
  if (sources.empty()) {
    throw soilhex::util::RasterReadError("no rasters found in " + ctx.raster_dir.string());
  }

  std::vector<LayerTask> tasks;
  for (const auto& source : sources) {
    const soilhex::runtime::config::DatasetConfig* dataset = nullptr;
    for (const auto& candidate : data.datasets()) {
      if (candidate.name() == source.dataset) dataset = &candidate;
    }
    tasks.push_back(LayerTask{source, dataset, tasks.size()});
  }

  // ------------------------------------------------------------
  // Per-layer chains on the worker pool; join is the barrier
  // ------------------------------------------------------------
  const soilhex::cache::PipelineCache cache(ctx.cache_dir, ctx.cache_enabled, ctx.fsync);
  std::vector<LayerResult>            results(tasks.size());
  {
    auto scheduler = std::make_shared<LayerScheduler>();
    auto processor = [&](const LayerTask& task) { return ProcessLayer(ctx, cache, task); };

    const size_t                              threads = std::clamp<size_t>(ctx.worker_threads, 1, tasks.size());
    std::vector<std::unique_ptr<LayerWorker>> workers;
    for (size_t i = 0; i < threads; ++i) {
      workers.push_back(std::make_unique<LayerWorker>(scheduler, processor, results));
      workers.back()->Start();
    }
    for (const auto& task : tasks) scheduler->Enqueue(task);
    scheduler->Shutdown();
    for (auto& worker : workers) worker->Join();
  }
  summary.cache_lookups = cache.Counts();

  std::vector<soilhex::hex::IndexedTable> indexed;
  for (size_t i = 0; i < tasks.size(); ++i) {
    const auto& task = tasks[i];
    if (results[i].error) {
      try {
        std::rethrow_exception(results[i].error);
      } catch (const soilhex::util::EmptyClipError& e) {
        if (IsRequired(task.source.dataset)) throw StageError("clip", task.source.Layer(), e.what());
        SOILHEX_LOG_WARN("Dropping layer with no valid pixels", {StringField("layer", task.source.Layer())});
        summary.dropped_layers.push_back(task.source.Layer());
        continue;
      }
    }

    auto& table = *results[i].indexed;

    LayerReport report;
    report.layer         = task.source.Layer();
    report.path          = task.source.path;
    report.coverage      = table.points.coverage;
    report.stats         = table.points.stats;
    report.filtered_rows = table.filtered_rows;
    report.rows          = table.points.size();
    summary.aoi_touches_boundary |= report.coverage.touches_boundary;

    SOILHEX_LOG_INFO("Layer ready", {StringField("layer", report.layer), IntField("rows", static_cast<int64_t>(report.rows)),
                                     DoubleField("fraction_valid", report.coverage.fraction_valid),
                                     BoolField("touches_boundary", report.coverage.touches_boundary)});

    summary.layers.push_back(std::move(report));
    indexed.push_back(std::move(table));
  }

  // ------------------------------------------------------------
  // Aggregate, then geometry, then score
  // ------------------------------------------------------------
  summary.aggregates = TimedStage("aggregate", [&] { return soilhex::hex::HexAggregator().Aggregate(indexed); });
  indexed.clear();

  summary.hex_count        = summary.aggregates.size();
  summary.boundaries_built = TimedStage("boundaries", [&] { return soilhex::hex::AttachBoundaries(summary.aggregates); });

  const soilhex::scoring::SuitabilityScorer scorer(config_.scoring(), ctx.min_points_per_hex);
  try {
    summary.report = TimedStage("score", [&] { return scorer.Score(summary.aggregates); });
  } catch (const soilhex::util::MissingRequiredPropertyError&) {
    throw;
  } catch (const std::exception& e) {
    throw StageError("score", "all layers", e.what());
  }
  summary.scored  = summary.report.scores.size();
  summary.skipped = summary.report.skipped;

  // ------------------------------------------------------------
  // Outputs
  // ------------------------------------------------------------
  const RunFlags flags{summary.aoi_touches_boundary};
  summary.aggregates_csv = TimedStage("write", [&] {
    return WriteOutputs(AggregatesToTable(summary.aggregates, flags), ctx.output_dir, "hex_aggregates", ctx.fsync);
  });
  summary.scores_csv = TimedStage("write", [&] {
    return WriteOutputs(ScoresToTable(summary.report, summary.aggregates, flags), ctx.output_dir, "suitability_scores", ctx.fsync);
  });

  SOILHEX_LOG_INFO("Pipeline run finished", {StringField("aoi", summary.aoi), IntField("hexes", static_cast<int64_t>(summary.hex_count)),
                                             IntField("scored", static_cast<int64_t>(summary.scored)), IntField("skipped", summary.skipped),
                                             BoolField("touches_boundary", summary.aoi_touches_boundary)});
  return summary;
}

soilhex::cache::SweepStats PipelineRunner::Sweep(const RunContext& ctx) const {
  const soilhex::cache::PipelineCache cache(ctx.cache_dir, ctx.cache_enabled, ctx.fsync);
  return cache.Sweep(ctx.protected_aois, std::chrono::seconds(config_.cache().tmp_grace_seconds()));
}

soilhex::cache::SweepStats PipelineRunner::ClearCache(const RunContext& ctx, const std::string& family) const {
  const soilhex::cache::PipelineCache cache(ctx.cache_dir, ctx.cache_enabled, ctx.fsync);
  return cache.Clear(family);
}

} // namespace soilhex::pipeline
