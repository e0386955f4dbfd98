#include "hex_aggregator.hpp"

#include <h3/h3api.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include "internal/observability/logging.hpp"

namespace soilhex::hex {

using soilhex::observability::IntField;

namespace {

struct Sum {
  double  total = 0.0;
  int64_t n     = 0;
};

struct CoordKeyHash {
  size_t operator()(const std::pair<int64_t, int64_t>& key) const {
    return std::hash<int64_t>()(key.first) * 31u + std::hash<int64_t>()(key.second);
  }
};

// Points are distinct per cell, so every accumulator that holds a value
// also holds at least one point.
struct CellAccumulator {
  std::unordered_set<std::pair<int64_t, int64_t>, CoordKeyHash> coords;
  double                                                        lon_sum = 0.0;
  double                                                        lat_sum = 0.0;
  std::map<std::string, Sum>                                    layers;
};

std::pair<int64_t, int64_t> CoordKey(double lon, double lat) {
  return {std::llround(lon * 1e6), std::llround(lat * 1e6)};
}

} // namespace

std::vector<HexAggregate> HexAggregator::Aggregate(const std::vector<IndexedTable>& tables) const {
  for (const auto& table : tables) {
    if (table.resolution != tables.front().resolution) {
      throw std::invalid_argument("cannot merge tables indexed at different resolutions");
    }
  }

  std::unordered_map<HexCell, CellAccumulator> cells;

  for (const auto& table : tables) {
    const auto& pts = table.points;
    for (size_t i = 0; i < pts.size(); ++i) {
      const double value = pts.value[i];
      if (!std::isfinite(value)) continue;

      auto& acc = cells[table.cells[i]];
      auto& sum = acc.layers[pts.layer];
      sum.total += value;
      ++sum.n;

      if (acc.coords.insert(CoordKey(pts.lon[i], pts.lat[i])).second) {
        acc.lon_sum += pts.lon[i];
        acc.lat_sum += pts.lat[i];
      }
    }
  }

  std::vector<HexAggregate> out;
  out.reserve(cells.size());
  for (auto& [cell, acc] : cells) {
    HexAggregate agg;
    agg.cell        = cell;
    agg.point_count = static_cast<int64_t>(acc.coords.size());
    agg.lon         = acc.lon_sum / static_cast<double>(agg.point_count);
    agg.lat         = acc.lat_sum / static_cast<double>(agg.point_count);
    for (const auto& [layer, sum] : acc.layers) {
      agg.mean[layer]  = sum.total / static_cast<double>(sum.n);
      agg.count[layer] = sum.n;
    }
    out.push_back(std::move(agg));
  }

  std::sort(out.begin(), out.end(), [](const HexAggregate& a, const HexAggregate& b) { return a.cell < b.cell; });

  SOILHEX_LOG_INFO("Aggregated hex cells", {IntField("cells", static_cast<int64_t>(out.size())), IntField("points", static_cast<int64_t>(seen.size()))});
  return out;
}

Ring BoundaryOf(HexCell cell) {
  CellBoundary boundary{};
  if (cellToBoundary(cell, &boundary) != E_SUCCESS) {
    throw std::invalid_argument("cellToBoundary failed for " + CellToString(cell));
  }

  Ring ring;
  ring.reserve(boundary.numVerts + 1);
  for (int i = 0; i < boundary.numVerts; ++i) {
    ring.emplace_back(radsToDegs(boundary.verts[i].lng), radsToDegs(boundary.verts[i].lat));
  }
  if (!ring.empty()) ring.push_back(ring.front());
  return ring;
}

size_t AttachBoundaries(std::vector<HexAggregate>& aggregates) {
  for (auto& agg : aggregates) agg.boundary = BoundaryOf(agg.cell);
  return aggregates.size();
}

std::string BoundaryToText(const Ring& ring) {
  std::string out = "[";
  for (size_t i = 0; i < ring.size(); ++i) {
    if (i > 0) out += ",";
    out += fmt::format("[{:.6f},{:.6f}]", ring[i].first, ring[i].second);
  }
  out += "]";
  return out;
}

} // namespace soilhex::hex
