#include "internal/raster/raster_catalog.hpp"

#include <cassert>
#include <fstream>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "raster_fixtures.hpp"

namespace {

using soilhex::raster::RasterCatalog;

soilhex::runtime::config::DataConfig DataFor(const std::filesystem::path& dir) {
  auto data = soilhex::config::ConfigLoader::Defaults().data();
  data.set_raster_dir(dir.string());
  return data;
}

void TestDiscoversDatasetsInConfigOrder() {
  const auto dir = soilhex::testing::FreshDir("catalog_order");
  soilhex::testing::WriteConstant(dir / "soil_pH_res_250_b10.tif", 65.0f);
  soilhex::testing::WriteConstant(dir / "soil_pH_res_250_b0.tif", 65.0f);
  soilhex::testing::WriteConstant(dir / "SOC_res_250_b0.tif", 30.0f);
  soilhex::testing::WriteConstant(dir / "soil_temp_res_250.tif", 295.0f);
  soilhex::testing::WriteConstant(dir / "soil_moisture_res_250.tif", 0.3f);

  const auto sources = RasterCatalog(DataFor(dir)).Discover();
  assert(sources.size() == 5);
  assert(sources[0].dataset == "soil_moisture");
  assert(sources[1].dataset == "soil_temperature");
  assert(sources[2].Layer() == "soil_organic_carbon@b0");
  assert(sources[3].Layer() == "soil_ph@b0");
  assert(sources[4].Layer() == "soil_ph@b10");
  assert(sources[0].resolution_tag == "res_250");
  assert(sources[0].size > 0 && sources[0].mtime_ns > 0);
}

void TestFineVariantShadowsCoarse() {
  const auto dir = soilhex::testing::FreshDir("catalog_resolution");
  soilhex::testing::WriteConstant(dir / "soil_moisture_res_3000.tif", 0.3f);
  soilhex::testing::WriteConstant(dir / "soil_moisture_res_250.tif", 0.3f);
  soilhex::testing::WriteConstant(dir / "soil_temp_res_3000.tif", 295.0f);

  const auto sources = RasterCatalog(DataFor(dir)).Discover();
  assert(sources.size() == 2);
  assert(sources[0].path.filename() == "soil_moisture_res_250.tif");
  assert(sources[1].resolution_tag == "res_3000");
}

void TestUnmatchedAndBandlessFilesAreSkipped() {
  const auto dir = soilhex::testing::FreshDir("catalog_skip");
  soilhex::testing::WriteConstant(dir / "elevation.tif", 100.0f);
  soilhex::testing::WriteConstant(dir / "SOC_res_250.tif", 30.0f);
  soilhex::testing::WriteConstant(dir / "SOC_res_250_b10.tif", 30.0f);
  std::ofstream(dir / "notes.txt") << "not a raster";

  const auto sources = RasterCatalog(DataFor(dir)).Discover();
  assert(sources.size() == 1);
  assert(sources[0].depth_band == "b10");
}

void TestMissingDirectoryThrows() {
  bool threw = false;
  try {
    RasterCatalog(DataFor(std::filesystem::temp_directory_path() / "soilhex_tests" / "no_such_dir")).Discover();
  } catch (const soilhex::util::RasterReadError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDiscoversDatasetsInConfigOrder();
  TestFineVariantShadowsCoarse();
  TestUnmatchedAndBandlessFilesAreSkipped();
  TestMissingDirectoryThrows();

  std::cout << "soilhex_unit_raster_catalog: pass\n";
  return 0;
}
