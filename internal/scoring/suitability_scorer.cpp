#include "suitability_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace soilhex::scoring {

using soilhex::observability::IntField;
using soilhex::runtime::config::PropertyScoring;
using soilhex::runtime::config::Range;
using soilhex::util::MissingRequiredPropertyError;

namespace {

bool InRange(const Range& range, double value) {
  if (range.has_min() && value < range.min()) return false;
  if (range.has_max() && value > range.max()) return false;
  return true;
}

double Round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

std::string DatasetOf(const std::string& layer) {
  return layer.substr(0, layer.find('@'));
}

} // namespace

std::string_view GradeName(Grade grade) {
  switch (grade) {
    case Grade::kHigh:
      return "High";
    case Grade::kModerate:
      return "Moderate";
    case Grade::kLow:
      return "Low";
    default:
      return "Not Suitable";
  }
}

std::string_view Recommendation(Grade grade) {
  switch (grade) {
    case Grade::kHigh:
      return "Very suitable, biochar highly recommended";
    case Grade::kModerate:
      return "Suitable, biochar recommended";
    case Grade::kLow:
      return "Marginal, biochar may help";
    default:
      return "Healthy soil, biochar not needed";
  }
}

std::string_view ColorHex(Grade grade) {
  switch (grade) {
    case Grade::kHigh:
      return "#d32f2f";
    case Grade::kModerate:
      return "#f57c00";
    case Grade::kLow:
      return "#fbc02d";
    default:
      return "#388e3c";
  }
}

std::optional<double> PropertyValue(const soilhex::hex::HexAggregate& aggregate, const std::string& dataset) {
  double sum   = 0.0;
  int    bands = 0;
  for (const auto& [layer, mean] : aggregate.mean) {
    if (DatasetOf(layer) == dataset && std::isfinite(mean)) {
      sum += mean;
      ++bands;
    }
  }
  if (bands == 0) return std::nullopt;
  return sum / bands;
}

SuitabilityScorer::SuitabilityScorer(soilhex::runtime::config::ScoringConfig config, uint32_t min_points_per_hex)
    : config_(std::move(config)), min_points_per_hex_(min_points_per_hex) {
  for (const auto& property : config_.properties()) max_weighted_sum_ += 3.0 * property.weight();
  if (max_weighted_sum_ <= 0.0) {
    throw std::invalid_argument("scoring config needs at least one weighted property");
  }
}

int SuitabilityScorer::SubScore(const PropertyScoring& property, double value) {
  if (InRange(property.optimal(), value)) return 3;
  if (InRange(property.moderate(), value)) return 2;
  if (InRange(property.marginal(), value)) return 1;
  return 0;
}

Grade SuitabilityScorer::GradeOf(double composite) const {
  if (composite >= config_.high_cutoff()) return Grade::kHigh;
  if (composite >= config_.moderate_cutoff()) return Grade::kModerate;
  if (composite >= config_.low_cutoff()) return Grade::kLow;
  return Grade::kNotSuitable;
}

SuitabilityScore SuitabilityScorer::Evaluate(const std::map<std::string, double>& values) const {
  SuitabilityScore score;
  double           weighted_sum = 0.0;

  for (const auto& property : config_.properties()) {
    PropertyScore entry;
    entry.dataset = property.dataset();

    auto it = values.find(property.dataset());
    if (it != values.end() && std::isfinite(it->second)) {
      entry.value = it->second;
    } else if (property.has_fallback()) {
      entry.value         = property.fallback();
      entry.fallback_used = true;
      score.fallback_used = true;
    } else {
      throw MissingRequiredPropertyError("required property " + property.dataset() + " has no value");
    }

    entry.subscore = SubScore(property, entry.value);
    weighted_sum += entry.subscore * property.weight();
    score.properties.push_back(std::move(entry));
  }

  score.quality_index = 100.0 * weighted_sum / max_weighted_sum_;
  score.composite     = Round2(100.0 - score.quality_index);
  score.rescaled      = score.composite / 10.0;
  score.grade         = GradeOf(score.composite);
  return score;
}

ScoreReport SuitabilityScorer::Score(const std::vector<soilhex::hex::HexAggregate>& aggregates) const {
  for (const auto& property : config_.properties()) {
    if (!property.required()) continue;
    const bool present = std::any_of(aggregates.begin(), aggregates.end(), [&](const auto& agg) { return PropertyValue(agg, property.dataset()).has_value(); });
    if (!present) {
      throw MissingRequiredPropertyError("required property " + property.dataset() + " is missing from the aggregated data");
    }
  }

  ScoreReport report;
  report.scores.reserve(aggregates.size());

  for (const auto& agg : aggregates) {
    std::map<std::string, double> values;
    bool                          missing_required = false;
    for (const auto& property : config_.properties()) {
      if (auto value = PropertyValue(agg, property.dataset())) {
        values[property.dataset()] = *value;
      } else if (property.required()) {
        missing_required = true;
      }
    }
    if (missing_required) {
      ++report.skipped;
      continue;
    }

    auto score            = Evaluate(values);
    score.cell            = agg.cell;
    score.low_point_count = agg.point_count < static_cast<int64_t>(min_points_per_hex_);
    report.scores.push_back(std::move(score));
  }

  if (report.skipped > 0) {
    SOILHEX_LOG_WARN("Skipped hexes missing a required property", {IntField("skipped", report.skipped)});
  }
  SOILHEX_LOG_INFO("Scored hexes", {IntField("scored", static_cast<int64_t>(report.scores.size()))});
  return report;
}

} // namespace soilhex::scoring
