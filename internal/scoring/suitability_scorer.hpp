#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/hex/hex_aggregator.hpp"

namespace soilhex::scoring {

enum class Grade {
  kNotSuitable,
  kLow,
  kModerate,
  kHigh,
};

std::string_view GradeName(Grade grade);
std::string_view Recommendation(Grade grade);
// Map fill colour, "#rrggbb"; red for the soils that need biochar most.
std::string_view ColorHex(Grade grade);

struct PropertyScore {
  std::string dataset;
  double      value         = 0.0;
  int         subscore      = 0;
  bool        fallback_used = false;
};

struct SuitabilityScore {
  soilhex::hex::HexCell      cell          = 0;
  double                     composite     = 0.0;  // [0, 100], 2 decimals
  double                     rescaled      = 0.0;  // composite / 10
  double                     quality_index = 0.0;
  Grade                      grade         = Grade::kNotSuitable;
  std::vector<PropertyScore> properties;
  bool                       fallback_used   = false;
  bool                       low_point_count = false;
};

struct ScoreReport {
  std::vector<SuitabilityScore> scores;
  int64_t                       skipped = 0;  // hexes missing a required property
};

/*
  Biochar suitability per hex.

  Each property maps to a sub-score through three nested closed ranges:
  3 inside optimal, 2 inside moderate, 1 inside marginal, 0 outside. An
  edge value therefore lands in the band nearer the optimum.

      quality   = 100 * sum(subscore * weight) / (3 * sum(weight))
      composite = round2(100 - quality)

  Poorer soil scores higher.
*/
class SuitabilityScorer {
 public:
  SuitabilityScorer(soilhex::runtime::config::ScoringConfig config, uint32_t min_points_per_hex);

  // Throws MissingRequiredPropertyError when a required property is absent
  // from every aggregate.
  ScoreReport Score(const std::vector<soilhex::hex::HexAggregate>& aggregates) const;

  // Scores one set of property values keyed by dataset name. Throws
  // MissingRequiredPropertyError when a required value is absent.
  SuitabilityScore Evaluate(const std::map<std::string, double>& values) const;

  static int SubScore(const soilhex::runtime::config::PropertyScoring& property, double value);

  Grade GradeOf(double composite) const;

 private:
  soilhex::runtime::config::ScoringConfig config_;
  uint32_t                                min_points_per_hex_;
  double                                  max_weighted_sum_ = 0.0;
};

// Mean over the depth-band layers of `dataset` present in the aggregate.
std::optional<double> PropertyValue(const soilhex::hex::HexAggregate& aggregate, const std::string& dataset);

} // namespace soilhex::scoring
