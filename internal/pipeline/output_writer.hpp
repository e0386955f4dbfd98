#pragma once

#include <arrow/table.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/hex/hex_aggregator.hpp"
#include "internal/scoring/suitability_scorer.hpp"

namespace soilhex::pipeline {

struct RunFlags {
  bool aoi_touches_boundary = false;
};

// One row per hex: means and counts per layer, boundary text, flags.
std::shared_ptr<arrow::Table> AggregatesToTable(const std::vector<soilhex::hex::HexAggregate>& aggregates, const RunFlags& flags);

// One row per scored hex, joined with its aggregate for position and boundary.
std::shared_ptr<arrow::Table> ScoresToTable(const soilhex::scoring::ScoreReport& report, const std::vector<soilhex::hex::HexAggregate>& aggregates,
                                            const RunFlags& flags);

/*
  Writes `<stem>.csv` and `<stem>.arrow` into `dir`, each atomically.
  Returns the CSV path.
*/
std::filesystem::path WriteOutputs(const std::shared_ptr<arrow::Table>& table, const std::filesystem::path& dir, const std::string& stem, bool fsync);

} // namespace soilhex::pipeline
