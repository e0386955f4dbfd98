#include "unit_converter.hpp"

#include <cmath>

namespace soilhex::table {

using namespace soilhex::runtime::config;

UnitConverter::UnitConverter(UnitConversion conversion) : conversion_(conversion) {
  switch (conversion_) {
    case UNIT_CONVERSION_FRACTION_TO_PCT:
    case UNIT_CONVERSION_G_PER_KG_TO_PCT:
      unit_ = "%";
      break;
    case UNIT_CONVERSION_KELVIN_TO_CELSIUS:
      unit_ = "degC";
      break;
    case UNIT_CONVERSION_PH_X10_TO_PH:
      unit_ = "pH";
      break;
    default:
      unit_ = "raw";
      break;
  }
}

double UnitConverter::Apply(double raw) const {
  switch (conversion_) {
    case UNIT_CONVERSION_FRACTION_TO_PCT:
      return raw * 100.0;
    case UNIT_CONVERSION_G_PER_KG_TO_PCT:
      return raw / 10.0;
    case UNIT_CONVERSION_KELVIN_TO_CELSIUS:
      return raw - 273.15;
    case UNIT_CONVERSION_PH_X10_TO_PH:
      return raw * 0.1;
    default:
      return raw;
  }
}

bool UnitConverter::Plausible(double value) const {
  if (!std::isfinite(value)) return false;
  switch (conversion_) {
    case UNIT_CONVERSION_FRACTION_TO_PCT:
    case UNIT_CONVERSION_G_PER_KG_TO_PCT:
      return value >= 0.0 && value <= 100.0;
    case UNIT_CONVERSION_KELVIN_TO_CELSIUS:
      return value >= -90.0 && value <= 70.0;
    case UNIT_CONVERSION_PH_X10_TO_PH:
      return value >= 0.0 && value <= 14.0;
    default:
      return true;
  }
}

} // namespace soilhex::table
