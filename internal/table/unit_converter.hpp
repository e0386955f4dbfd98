#pragma once

#include <string>

#include "config/config.pb.h"

namespace soilhex::table {

/*
  Normalizes raw raster values into the units the scorer expects.
*/
class UnitConverter {
 public:
  explicit UnitConverter(soilhex::runtime::config::UnitConversion conversion);

  double Apply(double raw) const;

  // Output unit label: "%", "degC", "pH" or "raw".
  const std::string& unit() const {
    return unit_;
  }

  // False for converted values no soil could physically have.
  bool Plausible(double value) const;

 private:
  soilhex::runtime::config::UnitConversion conversion_;
  std::string                              unit_;
};

} // namespace soilhex::table
