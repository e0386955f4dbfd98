#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace soilhex::runtime::config;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "soilhex_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)soilhex::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsMatchReferenceDeployment() {
  const auto config = soilhex::config::ConfigLoader::Defaults();

  assert(config.data().datasets_size() == 4);
  assert(config.data().datasets(2).name() == "soil_organic_carbon");
  assert(config.data().datasets(2).depth_bands_size() == 2);
  assert(config.region().min_lat() == -18.0 && config.region().max_lon() == -50.0);
  assert(config.region().default_radius_km() == 100.0);
  assert(config.region().min_radius_km() == 1.0);
  assert(config.processing().full_extent_resolution() == 5);
  assert(config.processing().circle_resolution() == 7);
  assert(config.processing().worker_threads() >= 1);
  assert(!config.cache().disabled());
  assert(config.cache().protected_aois_size() == 1);

  const auto& scoring = config.scoring();
  assert(scoring.properties_size() == 4);
  assert(scoring.properties(1).dataset() == "soil_organic_carbon");
  assert(scoring.properties(1).required());
  assert(!scoring.properties(1).optimal().has_max());
  assert(scoring.properties(0).has_fallback() && scoring.properties(0).fallback() == 50.0);
  assert(scoring.high_cutoff() == 76.0 && scoring.moderate_cutoff() == 51.0 && scoring.low_cutoff() == 26.0);
}

void TestPartialFileKeepsDefaultsForOmittedSections() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(data:
  raster_dir: "/srv/rasters"
processing:
  circle_resolution: 8
  nodata_policy: NODATA_POLICY_NAN
cache:
  disabled: true
)");

  const auto config = soilhex::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.data().raster_dir() == "/srv/rasters");
  assert(config.data().output_dir() == "data/processed");
  assert(config.data().datasets_size() == 4);
  assert(config.processing().circle_resolution() == 8);
  assert(config.processing().full_extent_resolution() == 5);
  assert(config.processing().nodata_policy() == NODATA_POLICY_NAN);
  assert(config.cache().disabled());
  assert(config.scoring().properties_size() == 4);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numbers",
                                   R"(data:
  raster_dir: "2024"
  fine_resolution_tag: "250"
)");

  const auto config = soilhex::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.data().raster_dir() == "2024");
  assert(config.data().fine_resolution_tag() == "250");
}

void TestCustomScoringIsValidated() {
  const auto nested = WriteYaml("scoring_ok",
                                R"(scoring:
  properties:
    - dataset: soil_ph
      weight: 1
      required: true
      optimal: {min: 6, max: 7}
      moderate: {min: 5, max: 8}
      marginal: {min: 4, max: 9}
)");
  const auto config = soilhex::config::ConfigLoader::LoadFromYaml(nested.string());
  assert(config.scoring().properties_size() == 1);
  assert(config.scoring().properties(0).moderate().min() == 5.0);

  const auto not_nested = WriteYaml("scoring_not_nested",
                                    R"(scoring:
  properties:
    - dataset: soil_ph
      weight: 1
      optimal: {min: 6, max: 9}
      moderate: {min: 5, max: 8}
      marginal: {min: 4, max: 9}
)");
  assert(LoadThrows(not_nested) && "optimal must lie within moderate");

  const auto cutoffs = WriteYaml("scoring_cutoffs",
                                 R"(scoring:
  high_cutoff: 50
  moderate_cutoff: 60
)");
  assert(LoadThrows(cutoffs) && "cutoffs must be ordered");
}

void TestInvalidRegionIsRejected() {
  const auto yaml_path = WriteYaml("bad_radius",
                                   R"(region:
  default_radius_km: 900
  max_radius_km: 500
)");
  assert(LoadThrows(yaml_path));

  const auto min_above_default = WriteYaml("bad_min_radius",
                                           R"(region:
  default_radius_km: 10
  min_radius_km: 20
)");
  assert(LoadThrows(min_above_default));
}

void TestZeroIsAnExplicitSetting() {
  const auto yaml_path = WriteYaml("explicit_zero",
                                   R"(region:
  min_radius_km: 0
processing:
  full_extent_resolution: 0
)");

  const auto config = soilhex::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.processing().full_extent_resolution() == 0);
  assert(config.processing().circle_resolution() == 7);
  assert(config.region().min_radius_km() == 0.0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(data:
  raster_dir: "/srv/rasters"
  unknown_field: 1
)");
  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  assert(LoadThrows(std::filesystem::temp_directory_path() / "soilhex_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestDefaultsMatchReferenceDeployment();
  TestPartialFileKeepsDefaultsForOmittedSections();
  TestQuotedNumbersStayStrings();
  TestCustomScoringIsValidated();
  TestInvalidRegionIsRejected();
  TestZeroIsAnExplicitSetting();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "soilhex_unit_config_loader: pass\n";
  return 0;
}
