#include "cache_key.hpp"

#include <cstring>

namespace soilhex::cache {

namespace {

constexpr uint64_t kPrime = 1099511628211ull;

void AddTag(Fnv1a64& h, std::string_view tag) {
  h.UpdateString(tag);
  h.UpdateBytes("\x1f", 1);
}

void HashShared(Fnv1a64& h, const CacheKeyInputs& inputs) {
  AddTag(h, "soilhex.cache/v1");
  h.UpdateString(inputs.family);
  h.UpdateString(inputs.operation);

  AddTag(h, "aoi");
  h.UpdateString(inputs.aoi);

  AddTag(h, "params");
  h.UpdateU64(inputs.params.size());
  for (const auto& [name, value] : inputs.params) {
    h.UpdateString(name);
    h.UpdateString(value);
  }
}

} // namespace

void Fnv1a64::UpdateBytes(const void* data, size_t size) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < size; ++i) {
    state_ ^= bytes[i];
    state_ *= kPrime;
  }
}

void Fnv1a64::UpdateU64(uint64_t value) {
  uint8_t bytes[8];
  for (int i = 0; i < 8; ++i) bytes[i] = static_cast<uint8_t>(value >> (8 * i));
  UpdateBytes(bytes, sizeof(bytes));
}

void Fnv1a64::UpdateI64(int64_t value) {
  UpdateU64(static_cast<uint64_t>(value));
}

void Fnv1a64::UpdateF64(double value) {
  if (value == 0.0) value = 0.0;  // fold -0.0
  uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  UpdateU64(bits);
}

void Fnv1a64::UpdateString(std::string_view value) {
  UpdateU64(value.size());
  UpdateBytes(value.data(), value.size());
}

std::string HashToHex(uint64_t hash) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[i] = kHex[hash & 0xF];
    hash >>= 4;
  }
  return out;
}

std::string Checksum(const uint8_t* data, size_t size) {
  Fnv1a64 h;
  h.UpdateBytes(data, size);
  return HashToHex(h.value());
}

CacheKey MakeCacheKey(const CacheKeyInputs& inputs) {
  Fnv1a64 slot;
  HashShared(slot, inputs);
  AddTag(slot, "sources");
  for (const auto& source : inputs.sources) slot.UpdateString(source.path.string());

  Fnv1a64 key;
  HashShared(key, inputs);
  AddTag(key, "sources");
  for (const auto& source : inputs.sources) {
    key.UpdateString(source.path.string());
    key.UpdateI64(source.mtime_ns);
    key.UpdateU64(source.size);
  }

  return CacheKey{inputs.operation + "-" + HashToHex(slot.value()), HashToHex(key.value())};
}

} // namespace soilhex::cache
