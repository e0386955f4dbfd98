#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/hex/hex_indexer.hpp"

namespace soilhex::hex {

using Ring = std::vector<std::pair<double, double>>;  // (lon, lat)

struct HexAggregate {
  HexCell cell        = 0;
  int64_t point_count = 0;
  double  lon         = 0.0;  // mean of member points
  double  lat         = 0.0;

  std::map<std::string, double>  mean;   // by layer
  std::map<std::string, int64_t> count;  // finite values per layer

  std::optional<Ring> boundary;
};

/*
  Merges indexed layers on cell id and averages each layer per cell.

  A point is a distinct pixel coordinate (rounded to 1e-6 degrees) carrying at
  least one finite value, so a coordinate present in several layers counts
  once. No geometry is built here.
*/
class HexAggregator {
 public:
  // Result is sorted by cell id. All tables must share one resolution.
  std::vector<HexAggregate> Aggregate(const std::vector<IndexedTable>& tables) const;
};

// Cell polygon as (lon, lat) vertices, closed.
Ring BoundaryOf(HexCell cell);

// Returns the number of polygons built.
size_t AttachBoundaries(std::vector<HexAggregate>& aggregates);

// [[lon,lat],...]
std::string BoundaryToText(const Ring& ring);

} // namespace soilhex::hex
