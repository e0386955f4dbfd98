#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/geo/aoi.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/pipeline/run_context.hpp"
#include "internal/util/errors.hpp"

using soilhex::observability::StringField;

namespace {

void Usage() {
  std::cerr << "Usage:\n"
            << "  soilhex run --config <config.yaml> [--lat X --lon Y] [--radius KM] [--h3-resolution N]\n"
            << "  soilhex sweep --config <config.yaml> [--lat X --lon Y --radius KM]\n"
            << "  soilhex clear-cache --config <config.yaml> [clip|table|hex_index]\n";
}

struct Arguments {
  std::string           command;
  std::string           config_path;
  std::optional<double> lat;
  std::optional<double> lon;
  std::optional<double> radius_km;
  std::optional<int>    resolution;
  std::string           family;
};

std::optional<Arguments> Parse(int argc, char** argv) {
  if (argc < 2) return std::nullopt;

  Arguments args;
  args.command = argv[1];
  if (args.command != "run" && args.command != "sweep" && args.command != "clear-cache") return std::nullopt;

  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    const bool        has_value = i + 1 < argc;

    if (flag == "--config" && has_value) {
      args.config_path = argv[++i];
    } else if (flag == "--lat" && has_value) {
      args.lat = std::stod(argv[++i]);
    } else if (flag == "--lon" && has_value) {
      args.lon = std::stod(argv[++i]);
    } else if (flag == "--radius" && has_value) {
      args.radius_km = std::stod(argv[++i]);
    } else if (flag == "--h3-resolution" && has_value && args.command == "run") {
      args.resolution = std::stoi(argv[++i]);
    } else if (args.command == "clear-cache" && args.family.empty() && flag.rfind("--", 0) != 0) {
      args.family = flag;
    } else {
      return std::nullopt;
    }
  }

  if (args.config_path.empty()) return std::nullopt;
  return args;
}

void PrintSummary(const soilhex::pipeline::RunSummary& summary) {
  std::cout << "aoi: " << summary.aoi << " (h3 resolution " << summary.resolution << ")\n";
  for (const auto& layer : summary.layers) {
    std::cout << "  " << layer.layer << ": " << layer.rows << " points, " << layer.stats.nodata_pixels << " nodata, "
              << layer.stats.anomalous_values << " anomalous, " << layer.filtered_rows << " unindexable, coverage "
              << layer.coverage.fraction_valid * 100.0 << "%" << (layer.coverage.touches_boundary ? " [touches raster boundary]" : "")
              << "\n";
  }
  for (const auto& layer : summary.dropped_layers) {
    std::cout << "  " << layer << ": dropped (no valid pixels)\n";
  }
  for (const auto& [family, counts] : summary.cache_lookups) {
    std::cout << "  cache " << family << ": " << counts.hits << " hit, " << counts.misses << " miss, " << counts.stale << " stale, " << counts.corrupt
              << " corrupt" << (counts.publish_failures ? ", publish failed" : "") << "\n";
  }
  std::cout << "hexes: " << summary.hex_count << ", scored: " << summary.scored << ", skipped: " << summary.skipped << "\n"
            << "aggregates: " << summary.aggregates_csv.string() << "\n"
            << "scores: " << summary.scores_csv.string() << "\n";
}

void PrintSweep(const soilhex::cache::SweepStats& stats) {
  std::cout << "entries removed: " << stats.entries_removed << ", artifacts removed: " << stats.artifacts_removed
            << ", tmp files removed: " << stats.tmp_removed << ", bytes freed: " << stats.bytes_freed << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::optional<Arguments> args;
  try {
    args = Parse(argc, argv);
  } catch (const std::exception&) {
    // stod/stoi on a malformed number
    args.reset();
  }
  if (!args) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = soilhex::config::ConfigLoader::LoadFromYaml(args->config_path);

    soilhex::observability::InitializeTracing(config);
    soilhex::observability::InitializeMetrics(config);
    soilhex::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Resolve AOI and build the run context
    // ------------------------------------------------------------
    const soilhex::geo::AoiResolver resolver(config.region());
    const auto                      aoi = resolver.Resolve(args->lat, args->lon, args->radius_km);
    const auto                      ctx = soilhex::pipeline::RunContext::Build(config, aoi, args->resolution);

    const soilhex::pipeline::PipelineRunner runner(config);

    if (args->command == "run") {
      PrintSummary(runner.Run(ctx));
    } else if (args->command == "sweep") {
      PrintSweep(runner.Sweep(ctx));
    } else {
      PrintSweep(runner.ClearCache(ctx, args->family));
    }

    soilhex::observability::ShutdownLogging();
    soilhex::observability::ShutdownMetrics();
    soilhex::observability::ShutdownTracing();
  } catch (const soilhex::util::StageError& e) {
    SOILHEX_LOG_ERROR("Stage failed", {StringField("stage", e.stage()), StringField("dataset", e.dataset()), StringField("error", e.what())});
    soilhex::observability::ShutdownLogging();
    soilhex::observability::ShutdownMetrics();
    soilhex::observability::ShutdownTracing();
    return 2;
  } catch (const std::exception& e) {
    SOILHEX_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    soilhex::observability::ShutdownLogging();
    soilhex::observability::ShutdownMetrics();
    soilhex::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
