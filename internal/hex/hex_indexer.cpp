#include "hex_indexer.hpp"

#include <h3/h3api.h>

#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace soilhex::hex {

using soilhex::observability::IntField;
using soilhex::observability::StringField;

namespace {

bool ValidCoordinate(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

} // namespace

HexIndexer::HexIndexer(int resolution) : resolution_(resolution) {
  if (resolution < 0 || resolution > 15) {
    throw std::invalid_argument("hex resolution must be within 0-15, got " + std::to_string(resolution));
  }
}

HexCell HexIndexer::CellOf(double lat, double lon) const {
  LatLng  point{degsToRads(lat), degsToRads(lon)};
  H3Index cell  = 0;
  H3Error error = latLngToCell(&point, resolution_, &cell);
  if (error != E_SUCCESS) {
    throw std::invalid_argument("latLngToCell failed with H3 error " + std::to_string(error));
  }
  return cell;
}

/*
  Single pass over the columns: invalid rows are compacted out in place and
  the survivors are indexed.
*/
IndexedTable HexIndexer::Index(soilhex::table::PointTable points) const {
  IndexedTable out;
  out.resolution = resolution_;

  auto&        lon = points.lon;
  auto&        lat = points.lat;
  auto&        val = points.value;
  const size_t n   = val.size();

  out.cells.resize(n);
  size_t  kept = 0;
  LatLng  point{};
  H3Index cell = 0;

  for (size_t i = 0; i < n; ++i) {
    if (!ValidCoordinate(lat[i], lon[i])) continue;

    point.lat = degsToRads(lat[i]);
    point.lng = degsToRads(lon[i]);
    if (latLngToCell(&point, resolution_, &cell) != E_SUCCESS) continue;

    lon[kept]       = lon[i];
    lat[kept]       = lat[i];
    val[kept]       = val[i];
    out.cells[kept] = cell;
    ++kept;
  }

  lon.resize(kept);
  lat.resize(kept);
  val.resize(kept);
  out.cells.resize(kept);
  out.filtered_rows = static_cast<int64_t>(n - kept);

  if (out.filtered_rows > 0) {
    SOILHEX_LOG_WARN("Filtered rows with invalid coordinates", {StringField("layer", points.layer), IntField("filtered", out.filtered_rows)});
  }

  out.points = std::move(points);
  return out;
}

std::string CellToString(HexCell cell) {
  char buffer[17];
  if (h3ToString(cell, buffer, sizeof(buffer)) != E_SUCCESS) {
    throw std::invalid_argument("invalid H3 cell");
  }
  return buffer;
}

HexCell CellFromString(const std::string& text) {
  H3Index cell = 0;
  if (stringToH3(text.c_str(), &cell) != E_SUCCESS || !isValidCell(cell)) {
    throw std::invalid_argument("invalid H3 cell string: " + text);
  }
  return cell;
}

} // namespace soilhex::hex
