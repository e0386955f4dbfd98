#include "output_writer.hpp"

#include <arrow/builder.h>
#include <arrow/csv/api.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/writer.h>

#include <cmath>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_arrow_store.hpp"

namespace soilhex::pipeline {

using soilhex::storage::common::Unwrap;

namespace {

class ColumnSet {
 public:
  template <typename Builder, typename Value>
  void Append(const std::string& name, std::shared_ptr<arrow::DataType> type, std::vector<std::optional<Value>> values) {
    Builder builder;
    for (const auto& value : values) {
      if (value) {
        Unwrap(builder.Append(*value));
      } else {
        Unwrap(builder.AppendNull());
      }
    }
    fields_.push_back(arrow::field(name, std::move(type)));
    arrays_.push_back(Unwrap(builder.Finish()));
  }

  std::shared_ptr<arrow::Table> Finish() {
    return arrow::Table::Make(arrow::schema(fields_), arrays_);
  }

 private:
  arrow::FieldVector                         fields_;
  std::vector<std::shared_ptr<arrow::Array>> arrays_;
};

std::string ColumnName(const std::string& layer) {
  std::string name = layer;
  for (auto& c : name) {
    if (c == '@') c = '_';
  }
  return name;
}

std::optional<double> Finite(double value) {
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

std::string BoundaryText(const soilhex::hex::HexAggregate& agg) {
  return agg.boundary ? soilhex::hex::BoundaryToText(*agg.boundary) : std::string();
}

} // namespace

std::shared_ptr<arrow::Table> AggregatesToTable(const std::vector<soilhex::hex::HexAggregate>& aggregates, const RunFlags& flags) {
  std::set<std::string> layers;
  for (const auto& agg : aggregates) {
    for (const auto& [layer, mean] : agg.mean) layers.insert(layer);
  }

  std::vector<std::optional<std::string>> cells, boundaries;
  std::vector<std::optional<int64_t>>     points;
  std::vector<std::optional<double>>      lons, lats;
  std::vector<std::optional<bool>>        touches;
  for (const auto& agg : aggregates) {
    cells.emplace_back(soilhex::hex::CellToString(agg.cell));
    points.emplace_back(agg.point_count);
    lons.emplace_back(agg.lon);
    lats.emplace_back(agg.lat);
    boundaries.emplace_back(BoundaryText(agg));
    touches.emplace_back(flags.aoi_touches_boundary);
  }

  ColumnSet columns;
  columns.Append<arrow::StringBuilder>("h3_index", arrow::utf8(), cells);
  columns.Append<arrow::Int64Builder>("point_count", arrow::int64(), points);
  columns.Append<arrow::DoubleBuilder>("lon", arrow::float64(), lons);
  columns.Append<arrow::DoubleBuilder>("lat", arrow::float64(), lats);

  for (const auto& layer : layers) {
    std::vector<std::optional<double>>  means;
    std::vector<std::optional<int64_t>> counts;
    for (const auto& agg : aggregates) {
      auto mean  = agg.mean.find(layer);
      auto count = agg.count.find(layer);
      means.push_back(mean == agg.mean.end() ? std::nullopt : Finite(mean->second));
      counts.emplace_back(count == agg.count.end() ? 0 : count->second);
    }
    columns.Append<arrow::DoubleBuilder>(ColumnName(layer), arrow::float64(), means);
    columns.Append<arrow::Int64Builder>(ColumnName(layer) + "_count", arrow::int64(), counts);
  }

  columns.Append<arrow::BooleanBuilder>("aoi_touches_boundary", arrow::boolean(), touches);
  columns.Append<arrow::StringBuilder>("boundary", arrow::utf8(), boundaries);
  return columns.Finish();
}

std::shared_ptr<arrow::Table> ScoresToTable(const soilhex::scoring::ScoreReport& report, const std::vector<soilhex::hex::HexAggregate>& aggregates,
                                            const RunFlags& flags) {
  std::unordered_map<soilhex::hex::HexCell, const soilhex::hex::HexAggregate*> by_cell;
  for (const auto& agg : aggregates) by_cell[agg.cell] = &agg;

  std::vector<std::optional<std::string>> cells, grades, recommendations, colors, boundaries;
  std::vector<std::optional<double>>      lons, lats, composite, rescaled, quality;
  std::vector<std::optional<bool>>        fallback, low_points, touches;

  for (const auto& score : report.scores) {
    const auto* agg = by_cell.at(score.cell);
    cells.emplace_back(soilhex::hex::CellToString(score.cell));
    lons.emplace_back(agg->lon);
    lats.emplace_back(agg->lat);
    composite.emplace_back(score.composite);
    rescaled.emplace_back(score.rescaled);
    quality.emplace_back(score.quality_index);
    grades.emplace_back(std::string(soilhex::scoring::GradeName(score.grade)));
    recommendations.emplace_back(std::string(soilhex::scoring::Recommendation(score.grade)));
    colors.emplace_back(std::string(soilhex::scoring::ColorHex(score.grade)));
    fallback.emplace_back(score.fallback_used);
    low_points.emplace_back(score.low_point_count);
    touches.emplace_back(flags.aoi_touches_boundary);
    boundaries.emplace_back(BoundaryText(*agg));
  }

  ColumnSet columns;
  columns.Append<arrow::StringBuilder>("h3_index", arrow::utf8(), cells);
  columns.Append<arrow::DoubleBuilder>("lon", arrow::float64(), lons);
  columns.Append<arrow::DoubleBuilder>("lat", arrow::float64(), lats);
  columns.Append<arrow::DoubleBuilder>("suitability_score", arrow::float64(), composite);
  columns.Append<arrow::DoubleBuilder>("suitability_score_10", arrow::float64(), rescaled);
  columns.Append<arrow::DoubleBuilder>("soil_quality_index", arrow::float64(), quality);
  columns.Append<arrow::StringBuilder>("suitability_grade", arrow::utf8(), grades);
  columns.Append<arrow::StringBuilder>("recommendation", arrow::utf8(), recommendations);
  columns.Append<arrow::StringBuilder>("color_hex", arrow::utf8(), colors);

  // Property columns follow the scoring config order, which every score shares.
  const size_t property_count = report.scores.empty() ? 0 : report.scores.front().properties.size();
  for (size_t p = 0; p < property_count; ++p) {
    const auto&                        dataset = report.scores.front().properties[p].dataset;
    std::vector<std::optional<double>>  values;
    std::vector<std::optional<int32_t>> subscores;
    std::vector<std::optional<bool>>    defaulted;
    for (const auto& score : report.scores) {
      values.emplace_back(score.properties[p].value);
      subscores.emplace_back(score.properties[p].subscore);
      defaulted.emplace_back(score.properties[p].fallback_used);
    }
    columns.Append<arrow::DoubleBuilder>(dataset, arrow::float64(), values);
    columns.Append<arrow::Int32Builder>(dataset + "_score", arrow::int32(), subscores);
    columns.Append<arrow::BooleanBuilder>(dataset + "_fallback", arrow::boolean(), defaulted);
  }

  columns.Append<arrow::BooleanBuilder>("fallback_used", arrow::boolean(), fallback);
  columns.Append<arrow::BooleanBuilder>("low_point_count", arrow::boolean(), low_points);
  columns.Append<arrow::BooleanBuilder>("aoi_touches_boundary", arrow::boolean(), touches);
  columns.Append<arrow::StringBuilder>("boundary", arrow::utf8(), boundaries);
  return columns.Finish();
}

std::filesystem::path WriteOutputs(const std::shared_ptr<arrow::Table>& table, const std::filesystem::path& dir, const std::string& stem, bool fsync) {
  soilhex::storage::DiskArrowStore store(dir);

  {
    auto sink = Unwrap(arrow::io::BufferOutputStream::Create());
    Unwrap(arrow::csv::WriteCSV(*table, arrow::csv::WriteOptions::Defaults(), sink.get()));
    store.Write(stem + ".csv", Unwrap(sink->Finish()), fsync);
  }

  {
    auto sink   = Unwrap(arrow::io::BufferOutputStream::Create());
    auto writer = Unwrap(arrow::ipc::MakeFileWriter(sink, table->schema()));
    Unwrap(writer->WriteTable(*table));
    Unwrap(writer->Close());
    store.Write(stem + ".arrow", Unwrap(sink->Finish()), fsync);
  }

  return dir / (stem + ".csv");
}

} // namespace soilhex::pipeline
