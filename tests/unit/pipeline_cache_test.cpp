#include "internal/cache/pipeline_cache.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/raster/raster_catalog.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using soilhex::cache::CacheKeyInputs;
using soilhex::cache::PipelineCache;
using soilhex::table::PointTable;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "soilhex_cache_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

soilhex::raster::RasterSource SourceAt(const fs::path& path) {
  soilhex::raster::RasterSource source;
  source.dataset = "soil_moisture";
  source.path    = path;
  return soilhex::raster::RasterCatalog::Describe(source);
}

CacheKeyInputs TableInputs(const soilhex::raster::RasterSource& source, const std::string& aoi, const std::string& policy = "NODATA_POLICY_SKIP") {
  return CacheKeyInputs{soilhex::cache::kTableFamily, "to_table", {source}, aoi, {{"nodata_policy", policy}}};
}

PointTable SampleTable() {
  PointTable table;
  table.layer = "soil_moisture";
  table.unit  = "%";
  table.Append({-56.0, -13.0, 25.0});
  table.Append({-55.9, -13.1, 35.0});
  table.stats.total_pixels          = 4;
  table.stats.nodata_pixels         = 2;
  table.stats.emitted               = 2;
  table.coverage.valid_pixels       = 2;
  table.coverage.footprint_pixels   = 4;
  table.coverage.fraction_valid     = 0.5;
  table.coverage.touches_boundary   = true;
  return table;
}

size_t CountFiles(const fs::path& dir, const std::string& suffix) {
  size_t count = 0;
  if (!fs::is_directory(dir)) return 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    const auto name = entry.path().filename().string();
    if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) ++count;
  }
  return count;
}

void TestKeyTracksSourceIdentity() {
  const auto dir    = FreshDir("key");
  WriteFile(dir / "soil_moisture.tif", "v1");
  auto source = SourceAt(dir / "soil_moisture.tif");

  const auto first = soilhex::cache::MakeCacheKey(TableInputs(source, "full"));
  assert(first.slot.rfind("to_table-", 0) == 0);
  assert(first.slot.size() == std::string("to_table-").size() + 16);

  source.mtime_ns += 1;
  const auto touched = soilhex::cache::MakeCacheKey(TableInputs(source, "full"));
  assert(touched.slot == first.slot);
  assert(touched.key != first.key);

  assert(soilhex::cache::MakeCacheKey(TableInputs(source, "circle:-13.000000:-56.000000:100.00")).slot != first.slot);
  assert(soilhex::cache::MakeCacheKey(TableInputs(source, "full", "NODATA_POLICY_NAN")).slot != first.slot);
}

void TestMissThenHit() {
  const auto dir = FreshDir("hit");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto         source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", true, false);

  int  calls   = 0;
  auto compute = [&] {
    ++calls;
    return SampleTable();
  };

  const auto first  = cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  const auto second = cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);

  assert(calls == 1);
  assert(second.layer == "soil_moisture" && second.unit == "%");
  assert(second.size() == 2);
  assert(second.value[1] == 35.0 && second.lon[1] == -55.9);
  assert(second.stats.nodata_pixels == 2);
  assert(second.coverage.touches_boundary);
  assert(second.coverage.fraction_valid == first.coverage.fraction_valid);

  assert(CountFiles(dir / "cache" / "table", ".manifest.json") == 1);
  assert(CountFiles(dir / "cache" / "table", ".arrow") == 1);
}

void TestChangedSourceRecomputes() {
  const auto dir = FreshDir("stale");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const PipelineCache cache(dir / "cache", true, false);

  int  calls   = 0;
  auto compute = [&] {
    ++calls;
    return SampleTable();
  };

  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), compute);
  WriteFile(dir / "soil_moisture.tif", "raster-bytes-rewritten");
  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), compute);

  assert(calls == 2);
  // the stale entry shares the slot and is replaced in place
  assert(CountFiles(dir / "cache" / "table", ".manifest.json") == 1);
}

void TestCorruptArtifactIsRebuilt() {
  const auto dir = FreshDir("corrupt");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto          source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", true, false);

  int  calls   = 0;
  auto compute = [&] {
    ++calls;
    return SampleTable();
  };

  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  for (const auto& entry : fs::directory_iterator(dir / "cache" / "table")) {
    if (entry.path().extension() == ".arrow") WriteFile(entry.path(), "garbage");
  }

  const auto rebuilt = cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  assert(calls == 2);
  assert(rebuilt.size() == 2);

  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  assert(calls == 2);
}

void TestDisabledCacheAlwaysComputes() {
  const auto dir = FreshDir("disabled");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto          source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", false, false);

  int  calls   = 0;
  auto compute = [&] {
    ++calls;
    return SampleTable();
  };
  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);

  assert(calls == 2);
  assert(!fs::exists(dir / "cache" / "table"));
}

void TestSweepKeepsOnlyProtectedEntries() {
  const auto dir = FreshDir("sweep");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto          source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", true, false);

  const std::string kept    = "circle:-13.000000:-56.000000:100.00";
  const std::string dropped = "circle:-10.000000:-52.000000:50.00";
  cache.GetOrCompute<PointTable>(TableInputs(source, kept), SampleTable);
  cache.GetOrCompute<PointTable>(TableInputs(source, dropped), SampleTable);
  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), SampleTable);

  const auto family = dir / "cache" / "table";
  WriteFile(family / "to_table-deadbeef.0000.arrow", "orphan");
  WriteFile(family / "to_table-deadbeef.manifest.json.tmp.1.abc", "partial");

  // a generous grace keeps young orphans and tmp files
  auto stats = cache.Sweep({"full", kept}, std::chrono::hours(1));
  assert(stats.entries_removed == 1);
  assert(stats.artifacts_removed == 1);
  assert(stats.tmp_removed == 0);
  assert(CountFiles(family, ".manifest.json") == 2);

  stats = cache.Sweep({"full", kept}, std::chrono::seconds(0));
  assert(stats.entries_removed == 0);
  assert(stats.artifacts_removed == 1);
  assert(stats.tmp_removed == 1);
  assert(CountFiles(family, ".arrow") == 2);

  int calls = 0;
  cache.GetOrCompute<PointTable>(TableInputs(source, kept), [&] {
    ++calls;
    return SampleTable();
  });
  assert(calls == 0);
}

void TestSweepDropsEntriesWithChangedSources() {
  const auto dir = FreshDir("sweep_changed");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const PipelineCache cache(dir / "cache", true, false);

  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), SampleTable);
  fs::remove(dir / "soil_moisture.tif");

  const auto stats = cache.Sweep({"full"}, std::chrono::hours(1));
  assert(stats.entries_removed == 1);
  assert(CountFiles(dir / "cache" / "table", ".manifest.json") == 0);
}

void TestClearByFamily() {
  const auto dir = FreshDir("clear");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto          source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", true, false);
  cache.GetOrCompute<PointTable>(TableInputs(source, "full"), SampleTable);

  assert(cache.Clear(soilhex::cache::kClipFamily).entries_removed == 0);

  const auto stats = cache.Clear(soilhex::cache::kTableFamily);
  assert(stats.entries_removed == 1);
  assert(stats.artifacts_removed == 1);
  assert(stats.bytes_freed > 0);

  bool threw = false;
  try {
    cache.Clear("tiles");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedPublishStillReturnsValue() {
  const auto dir = FreshDir("publish_failure");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const auto          source = SourceAt(dir / "soil_moisture.tif");
  const PipelineCache cache(dir / "cache", true, false);

  // a directory squatting on the manifest name makes every publish fail
  const auto manifest = dir / "cache" / "table" / soilhex::cache::ManifestName(soilhex::cache::MakeCacheKey(TableInputs(source, "full")).slot);
  fs::create_directories(manifest / "inner");

  int  calls   = 0;
  auto compute = [&] {
    ++calls;
    return SampleTable();
  };

  const auto first  = cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);
  const auto second = cache.GetOrCompute<PointTable>(TableInputs(source, "full"), compute);

  assert(first.size() == 2 && second.size() == 2);
  assert(second.value[1] == 35.0);
  assert(calls == 2);

  const auto counts = cache.Counts().at(soilhex::cache::kTableFamily);
  assert(counts.publish_failures == 2);
  assert(counts.hits == 0);
  assert(fs::is_directory(manifest));
}

void TestCountsTrackLookupOutcomes() {
  const auto dir = FreshDir("counts");
  WriteFile(dir / "soil_moisture.tif", "raster-bytes");
  const PipelineCache cache(dir / "cache", true, false);

  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), SampleTable);
  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), SampleTable);
  WriteFile(dir / "soil_moisture.tif", "raster-bytes-rewritten");
  cache.GetOrCompute<PointTable>(TableInputs(SourceAt(dir / "soil_moisture.tif"), "full"), SampleTable);

  const auto counts = cache.Counts();
  assert(counts.size() == 1);
  const auto& table = counts.at(soilhex::cache::kTableFamily);
  assert(table.misses == 1);
  assert(table.hits == 1);
  assert(table.stale == 1);
  assert(table.corrupt == 0 && table.publish_failures == 0);
}

void TestSweepSkipsManifestRemovedAfterListing() {
  const auto dir = FreshDir("sweep_vanished");
  const PipelineCache cache(dir / "cache", true, false);

  // Sweeping "a" deletes the file its manifest names, which is the manifest
  // of "b". The sweep then reaches "b" from its listing after it is gone, as
  // when another process invalidates an entry mid-sweep.
  const auto family = dir / "cache" / "table";
  fs::create_directories(family);
  WriteFile(family / "a.manifest.json", R"({"aoi": "circle:-10.000000:-52.000000:50.00", "artifact": "b.manifest.json"})");
  WriteFile(family / "b.manifest.json", R"({"aoi": "full", "artifact": "b.0000.arrow"})");

  const auto stats = cache.Sweep({"full"}, std::chrono::hours(1));
  assert(stats.entries_removed == 1);
  assert(stats.artifacts_removed == 1);
  assert(CountFiles(family, ".manifest.json") == 0);
}

void TestSweepDropsUnreadableManifest() {
  const auto dir = FreshDir("sweep_garbage");
  const PipelineCache cache(dir / "cache", true, false);

  const auto family = dir / "cache" / "hex_index";
  fs::create_directories(family);
  WriteFile(family / "hex_index-0123456789abcdef.manifest.json", "{not json");

  const auto stats = cache.Sweep({"full"}, std::chrono::hours(1));
  assert(stats.entries_removed == 1);
  assert(CountFiles(family, ".manifest.json") == 0);
}

} // namespace

int main() {
  TestKeyTracksSourceIdentity();
  TestMissThenHit();
  TestChangedSourceRecomputes();
  TestCorruptArtifactIsRebuilt();
  TestDisabledCacheAlwaysComputes();
  TestSweepKeepsOnlyProtectedEntries();
  TestSweepDropsEntriesWithChangedSources();
  TestClearByFamily();
  TestFailedPublishStillReturnsValue();
  TestCountsTrackLookupOutcomes();
  TestSweepSkipsManifestRemovedAfterListing();
  TestSweepDropsUnreadableManifest();

  std::cout << "soilhex_unit_pipeline_cache: pass\n";
  return 0;
}
