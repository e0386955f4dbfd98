#include "run_context.hpp"

#include <algorithm>
#include <stdexcept>

namespace soilhex::pipeline {

RunContext RunContext::Build(const soilhex::runtime::config::RuntimeConfig& config, soilhex::geo::AreaOfInterest aoi,
                             std::optional<int> resolution) {
  RunContext ctx;
  ctx.aoi = std::move(aoi);

  const auto& processing = config.processing();
  ctx.resolution         = resolution.value_or(static_cast<int>(soilhex::geo::IsFullExtent(ctx.aoi) ? processing.full_extent_resolution()
                                                                                                      : processing.circle_resolution()));
  if (ctx.resolution < 0 || ctx.resolution > 15) {
    throw std::invalid_argument("hex resolution must be within 0-15, got " + std::to_string(ctx.resolution));
  }

  ctx.raster_dir         = config.data().raster_dir();
  ctx.output_dir         = config.data().output_dir();
  ctx.cache_dir          = config.data().cache_dir();
  ctx.nodata_policy      = processing.nodata_policy();
  ctx.worker_threads     = std::max(1u, processing.worker_threads());
  ctx.min_points_per_hex = processing.min_points_per_hex();
  ctx.cache_enabled      = !config.cache().disabled();
  ctx.fsync              = processing.fsync();

  ctx.protected_aois.insert(soilhex::geo::Descriptor(soilhex::geo::FullExtent{}));
  for (const auto& descriptor : config.cache().protected_aois()) {
    ctx.protected_aois.insert(soilhex::geo::Descriptor(soilhex::geo::FromProto(descriptor)));
  }
  ctx.protected_aois.insert(soilhex::geo::Descriptor(ctx.aoi));

  return ctx;
}

} // namespace soilhex::pipeline
