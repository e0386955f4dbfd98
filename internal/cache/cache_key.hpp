#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/raster/raster_types.hpp"

namespace soilhex::cache {

/*
  FNV-1a 64-bit. Platform stable: strings are length-delimited and doubles
  are hashed through their bit pattern.
*/
class Fnv1a64 {
 public:
  void UpdateBytes(const void* data, size_t size);
  void UpdateU64(uint64_t value);
  void UpdateI64(int64_t value);
  void UpdateF64(double value);
  void UpdateString(std::string_view value);

  uint64_t value() const {
    return state_;
  }

 private:
  uint64_t state_ = 1469598103934665603ull;
};

std::string HashToHex(uint64_t hash);

// Hex checksum of a byte range.
std::string Checksum(const uint8_t* data, size_t size);

/*
  Everything a cached artifact depends on. Params are ordered by key.
*/
struct CacheKeyInputs {
  std::string                                family;
  std::string                                operation;
  std::vector<soilhex::raster::RasterSource> sources;
  std::string                                aoi;
  std::map<std::string, std::string>         params;
};

/*
  slot: where the entry lives. Ignores source mtimes so a changed source
        overwrites its own stale entry.
  key:  full identity including mtimes and sizes; must match for a hit.
*/
struct CacheKey {
  std::string slot;
  std::string key;
};

CacheKey MakeCacheKey(const CacheKeyInputs& inputs);

} // namespace soilhex::cache
