#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <thread>

namespace soilhex::config {

using namespace soilhex::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

namespace {

void AddDataset(DataConfig* data, const std::string& name, std::initializer_list<const char*> keywords, UnitConversion conversion,
                std::initializer_list<const char*> bands) {
  auto* dataset = data->add_datasets();
  dataset->set_name(name);
  for (const auto* keyword : keywords) dataset->add_keywords(keyword);
  dataset->set_conversion(conversion);
  for (const auto* band : bands) dataset->add_depth_bands(band);
}

void SetRange(Range* range, std::optional<double> min, std::optional<double> max) {
  if (min) range->set_min(*min);
  if (max) range->set_max(*max);
}

void AddProperty(ScoringConfig* scoring, const std::string& dataset, double weight, std::pair<std::optional<double>, std::optional<double>> optimal,
                 std::pair<std::optional<double>, std::optional<double>> moderate,
                 std::pair<std::optional<double>, std::optional<double>> marginal, std::optional<double> fallback) {
  auto* property = scoring->add_properties();
  property->set_dataset(dataset);
  property->set_weight(weight);
  SetRange(property->mutable_optimal(), optimal.first, optimal.second);
  SetRange(property->mutable_moderate(), moderate.first, moderate.second);
  SetRange(property->mutable_marginal(), marginal.first, marginal.second);
  if (fallback) {
    property->set_fallback(*fallback);
  } else {
    property->set_required(true);
  }
}

void ValidateRange(const PropertyScoring& property) {
  auto within = [](const Range& inner, const Range& outer) {
    if (outer.has_min() && (!inner.has_min() || inner.min() < outer.min())) return false;
    if (outer.has_max() && (!inner.has_max() || inner.max() > outer.max())) return false;
    return true;
  };
  if (!within(property.optimal(), property.moderate()) || !within(property.moderate(), property.marginal())) {
    throw std::invalid_argument("scoring ranges for " + property.dataset() + " must nest optimal within moderate within marginal");
  }
  if (property.weight() <= 0.0) {
    throw std::invalid_argument("scoring weight for " + property.dataset() + " must be positive");
  }
  if (property.required() && property.has_fallback()) {
    throw std::invalid_argument("required property " + property.dataset() + " cannot declare a fallback");
  }
}

} // namespace

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* data = config.mutable_data();
  if (data->raster_dir().empty()) data->set_raster_dir("data/raw");
  if (data->output_dir().empty()) data->set_output_dir("data/processed");
  if (data->cache_dir().empty()) data->set_cache_dir("data/cache");
  if (data->fine_resolution_tag().empty()) data->set_fine_resolution_tag("res_250");
  if (data->coarse_resolution_tag().empty()) data->set_coarse_resolution_tag("res_3000");
  if (data->datasets_size() == 0) {
    AddDataset(data, "soil_moisture", {"soil_moisture"}, UNIT_CONVERSION_FRACTION_TO_PCT, {});
    AddDataset(data, "soil_temperature", {"soil_temp"}, UNIT_CONVERSION_KELVIN_TO_CELSIUS, {});
    AddDataset(data, "soil_organic_carbon", {"SOC", "soil_organic_carbon"}, UNIT_CONVERSION_G_PER_KG_TO_PCT, {"b0", "b10"});
    AddDataset(data, "soil_ph", {"soil_pH"}, UNIT_CONVERSION_PH_X10_TO_PH, {"b0", "b10"});
  }

  auto* region = config.mutable_region();
  if (region->min_lat() == 0.0 && region->max_lat() == 0.0) {
    region->set_min_lat(-18.0);
    region->set_max_lat(-7.0);
  }
  if (region->min_lon() == 0.0 && region->max_lon() == 0.0) {
    region->set_min_lon(-62.0);
    region->set_max_lon(-50.0);
  }
  if (region->default_radius_km() == 0.0) region->set_default_radius_km(100.0);
  if (region->max_radius_km() == 0.0) region->set_max_radius_km(500.0);
  if (!region->has_min_radius_km()) region->set_min_radius_km(1.0);
  if (region->min_lat() >= region->max_lat() || region->min_lon() >= region->max_lon()) {
    throw std::invalid_argument("region bounds must satisfy min < max");
  }
  if (region->min_radius_km() < 0.0 || region->min_radius_km() > region->max_radius_km()) {
    throw std::invalid_argument("region.min_radius_km must lie in [0, max_radius_km]");
  }
  if (region->default_radius_km() <= 0.0 || region->default_radius_km() < region->min_radius_km() ||
      region->default_radius_km() > region->max_radius_km()) {
    throw std::invalid_argument("region.default_radius_km must lie in [min_radius_km, max_radius_km]");
  }

  auto* processing = config.mutable_processing();
  if (!processing->has_full_extent_resolution()) processing->set_full_extent_resolution(5);
  if (!processing->has_circle_resolution()) processing->set_circle_resolution(7);
  if (processing->full_extent_resolution() > 15 || processing->circle_resolution() > 15) {
    throw std::invalid_argument("hex resolution must be within 0-15");
  }
  if (processing->worker_threads() == 0) {
    processing->set_worker_threads(std::max(1u, std::thread::hardware_concurrency()));
  }
  if (processing->min_points_per_hex() == 0) processing->set_min_points_per_hex(3);

  auto* cache = config.mutable_cache();
  if (cache->tmp_grace_seconds() == 0) cache->set_tmp_grace_seconds(3600);
  if (cache->protected_aois_size() == 0) {
    auto* aoi = cache->add_protected_aois();
    aoi->set_lat(-13.0);
    aoi->set_lon(-56.0);
    aoi->set_radius_km(100.0);
  }

  auto* scoring = config.mutable_scoring();
  if (scoring->properties_size() == 0) {
    AddProperty(scoring, "soil_moisture", 0.5, {50.0, 60.0}, {30.0, 70.0}, {20.0, 80.0}, 50.0);
    AddProperty(scoring, "soil_organic_carbon", 1.0, {4.0, std::nullopt}, {2.0, std::nullopt}, {1.0, std::nullopt}, std::nullopt);
    AddProperty(scoring, "soil_ph", 0.7, {6.0, 7.0}, {4.5, 8.0}, {3.0, 9.0}, std::nullopt);
    AddProperty(scoring, "soil_temperature", 0.2, {15.0, 25.0}, {10.0, 30.0}, {0.0, 35.0}, 20.0);
  }
  if (scoring->high_cutoff() == 0.0) scoring->set_high_cutoff(76.0);
  if (scoring->moderate_cutoff() == 0.0) scoring->set_moderate_cutoff(51.0);
  if (scoring->low_cutoff() == 0.0) scoring->set_low_cutoff(26.0);
  if (!(scoring->low_cutoff() < scoring->moderate_cutoff() && scoring->moderate_cutoff() < scoring->high_cutoff())) {
    throw std::invalid_argument("scoring cutoffs must satisfy low < moderate < high");
  }
  for (const auto& property : scoring->properties()) ValidateRange(property);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("soilhex");
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  try {
    ApplyDefaults(config);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }

  return config;
}

} // namespace soilhex::config
