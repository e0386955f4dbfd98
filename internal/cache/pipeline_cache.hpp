#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <arrow/buffer.h>

#include "internal/cache/artifact_codec.hpp"
#include "internal/cache/cache_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_arrow_store.hpp"
#include "soilhex/cache/v1/manifest.pb.h"

namespace soilhex::cache {

inline constexpr const char* kClipFamily  = "clip";
inline constexpr const char* kTableFamily = "table";
inline constexpr const char* kIndexFamily = "hex_index";

struct SweepStats {
  int64_t  entries_removed   = 0;
  int64_t  artifacts_removed = 0;
  int64_t  tmp_removed       = 0;
  uint64_t bytes_freed       = 0;
};

// Lookup outcomes for one family. A lookup that hits never reaches the
// families nested inside it.
struct LookupCounts {
  int64_t hits             = 0;
  int64_t misses           = 0;
  int64_t stale            = 0;
  int64_t corrupt          = 0;
  int64_t publish_failures = 0;
};

/*
  Content-addressable artifact cache, one directory per family:

      <root>/<family>/<slot>.manifest.json
      <root>/<family>/<slot>.<checksum>.arrow

  The artifact is written first, re-read and verified, then the manifest is
  published by rename. A manifest therefore only ever names a complete
  artifact. Readers re-check the key, the recorded source identities and
  the artifact checksum on every lookup.

  Safe for concurrent use from several threads and processes. Cache I/O
  failures never fail the caller: a failed publish is logged and counted
  and the computed value is returned.
*/
class PipelineCache {
 public:
  PipelineCache(std::filesystem::path root, bool enabled, bool fsync);

  /*
    Returns the cached artifact for `inputs` or runs `compute` and stores its
    result. `compute` is not invoked on a verified hit.
  */
  template <typename T, typename Compute>
  T GetOrCompute(const CacheKeyInputs& inputs, Compute&& compute) const;

  // Removes entries for AOIs outside `protected_aois`, entries whose sources
  // changed, unreferenced artifacts and temporary files older than `tmp_grace`.
  SweepStats Sweep(const std::set<std::string>& protected_aois, std::chrono::seconds tmp_grace) const;

  // Removes every file of one family, or of all families when empty.
  SweepStats Clear(const std::string& family = {}) const;

  // Per-family lookup outcomes recorded by this instance.
  std::map<std::string, LookupCounts> Counts() const;

  bool enabled() const {
    return enabled_;
  }

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::optional<std::shared_ptr<arrow::Buffer>> Lookup(const CacheKeyInputs& inputs, const CacheKey& key) const;
  void Publish(const CacheKeyInputs& inputs, const CacheKey& key, const std::shared_ptr<arrow::RecordBatch>& batch) const;
  void PublishOnce(const CacheKeyInputs& inputs, const CacheKey& key, const std::shared_ptr<arrow::Buffer>& buffer, int64_t rows) const;
  void Invalidate(const std::string& family, const std::string& slot, const std::string& reason) const;
  void Record(const std::string& family, std::string_view outcome) const;

  std::optional<soilhex::cache::v1::CacheManifest> ReadManifest(const soilhex::storage::DiskArrowStore& store, const std::string& name) const;
  soilhex::storage::DiskArrowStore                 Family(const std::string& family) const;

  std::filesystem::path root_;
  bool                  enabled_;
  bool                  fsync_;

  mutable std::mutex                          counts_mutex_;
  mutable std::map<std::string, LookupCounts> counts_;
};

std::string ManifestName(const std::string& slot);

// ------------------------------------------------------------
// Template implementation
// ------------------------------------------------------------

template <typename T, typename Compute>
T PipelineCache::GetOrCompute(const CacheKeyInputs& inputs, Compute&& compute) const {
  if (!enabled_) {
    return compute();
  }

  const auto key = MakeCacheKey(inputs);

  if (auto buffer = Lookup(inputs, key)) {
    try {
      return ArtifactCodec<T>::Decode(soilhex::storage::common::DeserializeBatch(*buffer));
    } catch (const std::exception& e) {
      Invalidate(inputs.family, key.slot, std::string("decode failed: ") + e.what());
    }
  }

  T value = compute();
  try {
    Publish(inputs, key, ArtifactCodec<T>::Encode(value));
  } catch (const std::exception& e) {
    Record(inputs.family, "publish_failed");
    SOILHEX_LOG_WARN("Cache publish failed, continuing uncached",
                     {soilhex::observability::StringField("family", inputs.family), soilhex::observability::StringField("slot", key.slot),
                      soilhex::observability::StringField("error", e.what())});
  }
  return value;
}

} // namespace soilhex::cache
