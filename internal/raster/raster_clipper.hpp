#pragma once

#include <utility>
#include <vector>

#include "internal/geo/aoi.hpp"
#include "internal/raster/raster_types.hpp"

namespace soilhex::raster {

/*
  Clips a raster band to an area of interest.

  FullExtent passes the band through unchanged. A circle is buffered in an
  azimuthal equidistant projection centred on the AOI, so the radius is a true
  ground distance, then transformed into the raster CRS. Pixels whose centres
  fall inside the buffer are kept and everything else in the output window is
  nodata.

  Partial overlap with the raster is reported through Coverage. Only a clip
  with zero valid pixels throws EmptyClipError.
*/
class RasterClipper {
 public:
  explicit RasterClipper(int ring_vertices = 128);

  ClippedRaster Clip(const RasterSource& source, const soilhex::geo::AreaOfInterest& aoi) const;

  // Buffer ring in the CRS given by `target_wkt`, closed (first == last).
  std::vector<std::pair<double, double>> BufferRing(const soilhex::geo::Circle& circle, const std::string& target_wkt) const;

 private:
  ClippedRaster ClipFull(const RasterSource& source) const;
  ClippedRaster ClipCircle(const RasterSource& source, const soilhex::geo::Circle& circle) const;

  int ring_vertices_;
};

// Ray casting test against a closed ring.
bool PointInRing(const std::vector<std::pair<double, double>>& ring, double x, double y);

} // namespace soilhex::raster
