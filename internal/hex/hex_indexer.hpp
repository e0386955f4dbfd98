#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/table/point_table.hpp"

namespace soilhex::hex {

using HexCell = uint64_t;

/*
  Point table with a parallel cell column. Rows with unusable coordinates
  have already been removed and counted in `filtered_rows`.
*/
struct IndexedTable {
  soilhex::table::PointTable points;
  std::vector<HexCell>       cells;
  int                        resolution    = 0;
  int64_t                    filtered_rows = 0;
};

/*
  Maps WGS84 points to H3 cells at a fixed resolution.
*/
class HexIndexer {
 public:
  // Throws std::invalid_argument outside 0-15.
  explicit HexIndexer(int resolution);

  IndexedTable Index(soilhex::table::PointTable points) const;

  HexCell CellOf(double lat, double lon) const;

  int resolution() const {
    return resolution_;
  }

 private:
  int resolution_;
};

std::string CellToString(HexCell cell);
HexCell     CellFromString(const std::string& text);

} // namespace soilhex::hex
