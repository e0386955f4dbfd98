#include "pipeline_cache.hpp"

#include <google/protobuf/util/json_util.h>

#include <arrow/buffer.h>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace soilhex::cache {

namespace fs = std::filesystem;

using soilhex::cache::v1::CacheManifest;
using soilhex::observability::IntField;
using soilhex::observability::Metrics;
using soilhex::observability::StringField;
using soilhex::storage::DiskArrowStore;
using soilhex::util::CacheCorruptionError;

namespace {

constexpr const char* kManifestSuffix = ".manifest.json";
constexpr const char* kArtifactSuffix = ".arrow";

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ChecksumOf(const std::shared_ptr<arrow::Buffer>& buffer) {
  return Checksum(buffer->data(), static_cast<size_t>(buffer->size()));
}

// True when every recorded source still exists with the same mtime and size.
bool SourcesUnchanged(const CacheManifest& manifest) {
  for (const auto& source : manifest.sources()) {
    std::error_code ec;
    const auto      size = fs::file_size(source.path(), ec);
    if (ec || size != source.size()) return false;
    try {
      if (soilhex::util::FileMtimeNs(source.path()) != source.mtime_ns()) return false;
    } catch (const fs::filesystem_error&) {
      return false;
    }
  }
  return true;
}

// Empty when the file vanished after it was listed.
std::optional<std::chrono::seconds> AgeOf(const DiskArrowStore& store, const std::string& name) {
  try {
    return soilhex::util::FileAge(store.root() / name);
  } catch (const fs::filesystem_error&) {
    return std::nullopt;
  }
}

} // namespace

std::string ManifestName(const std::string& slot) {
  return slot + kManifestSuffix;
}

PipelineCache::PipelineCache(fs::path root, bool enabled, bool fsync) : root_(std::move(root)), enabled_(enabled), fsync_(fsync) {
}

DiskArrowStore PipelineCache::Family(const std::string& family) const {
  return DiskArrowStore(root_ / family);
}

std::optional<CacheManifest> PipelineCache::ReadManifest(const DiskArrowStore& store, const std::string& name) const {
  std::shared_ptr<arrow::Buffer> buffer;
  try {
    buffer = store.Read(name);
  } catch (const std::runtime_error& e) {
    // Never written, or removed by another writer's invalidation.
    if (!store.Exists(name)) return std::nullopt;
    throw CacheCorruptionError("unreadable manifest " + name + ": " + e.what());
  }

  std::string json(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));

  CacheManifest manifest;
  auto          status = google::protobuf::util::JsonStringToMessage(json, &manifest);
  if (!status.ok()) {
    throw CacheCorruptionError("unreadable manifest " + name + ": " + std::string(status.message()));
  }
  return manifest;
}

void PipelineCache::Record(const std::string& family, std::string_view outcome) const {
  Metrics::Instance().RecordCacheLookup(family, outcome);

  std::lock_guard<std::mutex> lock(counts_mutex_);
  auto&                       counts = counts_[family];
  if (outcome == "hit") {
    ++counts.hits;
  } else if (outcome == "miss") {
    ++counts.misses;
  } else if (outcome == "stale") {
    ++counts.stale;
  } else if (outcome == "corrupt") {
    ++counts.corrupt;
  } else {
    ++counts.publish_failures;
  }
}

std::map<std::string, LookupCounts> PipelineCache::Counts() const {
  std::lock_guard<std::mutex> lock(counts_mutex_);
  return counts_;
}

std::optional<std::shared_ptr<arrow::Buffer>> PipelineCache::Lookup(const CacheKeyInputs& inputs, const CacheKey& key) const {
  auto store = Family(inputs.family);

  try {
    auto manifest = ReadManifest(store, ManifestName(key.slot));
    if (!manifest) {
      Record(inputs.family, "miss");
      return std::nullopt;
    }

    if (manifest->key() != key.key || !SourcesUnchanged(*manifest)) {
      Record(inputs.family, "stale");
      SOILHEX_LOG_INFO("Cache entry stale", {StringField("family", inputs.family), StringField("slot", key.slot)});
      return std::nullopt;
    }

    std::shared_ptr<arrow::Buffer> buffer;
    try {
      buffer = store.Read(manifest->artifact());
    } catch (const std::runtime_error& e) {
      throw CacheCorruptionError("artifact " + manifest->artifact() + " unreadable: " + e.what());
    }
    if (ChecksumOf(buffer) != manifest->checksum()) {
      throw CacheCorruptionError("artifact " + manifest->artifact() + " failed checksum verification");
    }

    Record(inputs.family, "hit");
    SOILHEX_LOG_DEBUG("Cache hit", {StringField("family", inputs.family), StringField("slot", key.slot)});
    return buffer;
  } catch (const CacheCorruptionError& e) {
    Record(inputs.family, "corrupt");
    Invalidate(inputs.family, key.slot, e.what());
    return std::nullopt;
  }
}

void PipelineCache::Invalidate(const std::string& family, const std::string& slot, const std::string& reason) const {
  SOILHEX_LOG_WARN("Invalidating cache entry", {StringField("family", family), StringField("slot", slot), StringField("reason", reason)});

  auto store = Family(family);
  store.Remove(ManifestName(slot));
  for (const auto& name : store.List()) {
    if (name.rfind(slot + ".", 0) == 0 && EndsWith(name, kArtifactSuffix)) store.Remove(name);
  }
}

void PipelineCache::Publish(const CacheKeyInputs& inputs, const CacheKey& key, const std::shared_ptr<arrow::RecordBatch>& batch) const {
  soilhex::observability::SpanScope span("cache.publish");
  span.SetAttribute("family", inputs.family);

  auto buffer = soilhex::storage::common::SerializeBatch(batch);
  try {
    PublishOnce(inputs, key, buffer, batch->num_rows());
  } catch (const CacheCorruptionError& e) {
    Invalidate(inputs.family, key.slot, e.what());
    PublishOnce(inputs, key, buffer, batch->num_rows());
  }
}

/*
  artifact tmp → rename → verify → manifest tmp → rename
*/
void PipelineCache::PublishOnce(const CacheKeyInputs& inputs, const CacheKey& key, const std::shared_ptr<arrow::Buffer>& buffer,
                                int64_t rows) const {
  auto store = Family(inputs.family);

  const auto checksum = ChecksumOf(buffer);
  const auto artifact = key.slot + "." + checksum + kArtifactSuffix;

  store.Write(artifact, buffer, fsync_);

  auto written = store.Read(artifact);
  if (ChecksumOf(written) != checksum) {
    throw CacheCorruptionError("artifact " + artifact + " failed post-write verification");
  }

  CacheManifest manifest;
  manifest.set_key(key.key);
  manifest.set_slot(key.slot);
  manifest.set_family(inputs.family);
  manifest.set_operation(inputs.operation);
  manifest.set_aoi(inputs.aoi);
  for (const auto& source : inputs.sources) {
    auto* identity = manifest.add_sources();
    identity->set_path(source.path.string());
    identity->set_mtime_ns(source.mtime_ns);
    identity->set_size(source.size);
  }
  for (const auto& [name, value] : inputs.params) (*manifest.mutable_params())[name] = value;
  manifest.set_artifact(artifact);
  manifest.set_checksum(checksum);
  manifest.set_size_bytes(static_cast<uint64_t>(buffer->size()));
  manifest.set_row_count(rows);
  *manifest.mutable_created_at() = soilhex::util::ToProto(soilhex::util::Now());

  std::string                           json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(manifest, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize cache manifest: " + std::string(status.message()));
  }

  store.Write(ManifestName(key.slot), arrow::Buffer::FromString(std::move(json)), fsync_);

  SOILHEX_LOG_DEBUG("Cache entry published", {StringField("family", inputs.family), StringField("artifact", artifact), IntField("rows", rows)});
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

SweepStats PipelineCache::Sweep(const std::set<std::string>& protected_aois, std::chrono::seconds tmp_grace) const {
  SweepStats stats;

  for (const char* family : {kClipFamily, kTableFamily, kIndexFamily}) {
    if (!fs::is_directory(root_ / family)) continue;
    auto store = Family(family);

    std::set<std::string> referenced;
    for (const auto& name : store.List()) {
      if (!EndsWith(name, kManifestSuffix) || soilhex::storage::common::IsTmpName(name)) continue;

      std::optional<CacheManifest> manifest;
      std::string                  reason;
      try {
        manifest = ReadManifest(store, name);
      } catch (const CacheCorruptionError& e) {
        reason = e.what();
      }

      if (!manifest && reason.empty()) continue;

      if (manifest && !protected_aois.count(manifest->aoi())) {
        reason = "aoi " + manifest->aoi() + " not protected";
      } else if (manifest && !SourcesUnchanged(*manifest)) {
        reason = "sources changed";
      }

      if (reason.empty()) {
        referenced.insert(manifest->artifact());
        continue;
      }

      SOILHEX_LOG_INFO("Sweeping cache entry", {StringField("family", family), StringField("manifest", name), StringField("reason", reason)});
      stats.bytes_freed += store.Remove(name);
      ++stats.entries_removed;
      if (manifest && store.Exists(manifest->artifact())) {
        stats.bytes_freed += store.Remove(manifest->artifact());
        ++stats.artifacts_removed;
      }
    }

    // Orphans younger than the grace period may belong to a writer that has
    // not published its manifest yet.

    for (const auto& name : store.List()) {
      const auto age = AgeOf(store, name);
      if (!age || *age < tmp_grace) continue;

      if (soilhex::storage::common::IsTmpName(name)) {
        stats.bytes_freed += store.Remove(name);
        ++stats.tmp_removed;
        continue;
      }
      if (EndsWith(name, kArtifactSuffix) && !referenced.count(name)) {
        stats.bytes_freed += store.Remove(name);
        ++stats.artifacts_removed;
      }
    }
  }

  SOILHEX_LOG_INFO("Cache sweep complete", {IntField("entries_removed", stats.entries_removed), IntField("artifacts_removed", stats.artifacts_removed),
                                            IntField("tmp_removed", stats.tmp_removed), IntField("bytes_freed", static_cast<int64_t>(stats.bytes_freed))});
  return stats;
}

SweepStats PipelineCache::Clear(const std::string& family) const {
  SweepStats stats;

  std::vector<std::string> families;
  if (family.empty()) {
    families = {kClipFamily, kTableFamily, kIndexFamily};
  } else if (family == kClipFamily || family == kTableFamily || family == kIndexFamily) {
    families = {family};
  } else {
    throw std::invalid_argument("unknown cache family: " + family);
  }

  for (const auto& name : families) {
    if (!fs::is_directory(root_ / name)) continue;
    auto store = Family(name);
    for (const auto& file : store.List()) {
      stats.bytes_freed += store.Remove(file);
      if (EndsWith(file, kManifestSuffix)) {
        ++stats.entries_removed;
      } else if (EndsWith(file, kArtifactSuffix)) {
        ++stats.artifacts_removed;
      } else {
        ++stats.tmp_removed;
      }
    }
  }

  SOILHEX_LOG_INFO("Cache cleared", {StringField("family", family.empty() ? "all" : family), IntField("entries_removed", stats.entries_removed)});
  return stats;
}

} // namespace soilhex::cache
