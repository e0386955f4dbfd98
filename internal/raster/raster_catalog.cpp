#include "raster_catalog.hpp"

#include <algorithm>
#include <filesystem>
#include <cctype>
#include <map>
#include <set>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace soilhex::raster {

namespace fs = std::filesystem;

using soilhex::observability::IntField;
using soilhex::observability::StringField;

namespace {

bool IsGeoTiff(const fs::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == ".tif" || ext == ".tiff";
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ReplaceFirst(std::string value, const std::string& from, const std::string& to) {
  const auto pos = value.find(from);
  if (pos != std::string::npos) value.replace(pos, from.size(), to);
  return value;
}

} // namespace

RasterCatalog::RasterCatalog(soilhex::runtime::config::DataConfig config) : config_(std::move(config)) {
}

RasterSource RasterCatalog::Describe(RasterSource source) {
  source.mtime_ns = soilhex::util::FileMtimeNs(source.path);
  source.size     = fs::file_size(source.path);
  return source;
}

std::vector<RasterSource> RasterCatalog::Discover() const {
  const fs::path dir(config_.raster_dir());
  if (!fs::is_directory(dir)) {
    throw soilhex::util::RasterReadError("raster directory does not exist: " + dir.string());
  }

  std::vector<fs::path>  files;
  std::set<std::string> names;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && IsGeoTiff(entry.path())) {
      files.push_back(entry.path());
      names.insert(entry.path().filename().string());
    }
  }
  std::sort(files.begin(), files.end());

  const auto& fine   = config_.fine_resolution_tag();
  const auto& coarse = config_.coarse_resolution_tag();

  std::vector<RasterSource> sources;
  for (const auto& file : files) {
    const auto name = file.filename().string();
    const auto stem = file.stem().string();

    if (!coarse.empty() && !fine.empty() && stem.find(coarse) != std::string::npos && names.count(ReplaceFirst(name, coarse, fine))) {
      SOILHEX_LOG_INFO("Skipping coarse raster, fine variant present", {StringField("file", name)});
      continue;
    }

    bool matched = false;
    for (int i = 0; i < config_.datasets_size() && !matched; ++i) {
      const auto& dataset = config_.datasets(i);
      const bool  keyword_hit =
          std::any_of(dataset.keywords().begin(), dataset.keywords().end(), [&](const std::string& k) { return stem.find(k) != std::string::npos; });
      if (!keyword_hit) continue;
      matched = true;

      RasterSource source;
      source.dataset = dataset.name();
      source.path    = file;
      if (!fine.empty() && stem.find(fine) != std::string::npos) {
        source.resolution_tag = fine;
      } else if (!coarse.empty() && stem.find(coarse) != std::string::npos) {
        source.resolution_tag = coarse;
      }

      if (dataset.depth_bands_size() > 0) {
        const auto band = std::find_if(dataset.depth_bands().begin(), dataset.depth_bands().end(),
                                       [&](const std::string& b) { return EndsWith(stem, "_" + b); });
        if (band == dataset.depth_bands().end()) {
          SOILHEX_LOG_WARN("Raster has no recognised depth band, skipping", {StringField("file", name), StringField("dataset", dataset.name())});
          continue;
        }
        source.depth_band = *band;
      }

      sources.push_back(Describe(std::move(source)));
    }

    if (!matched) {
      SOILHEX_LOG_DEBUG("Raster matches no dataset", {StringField("file", name)});
    }
  }

  std::map<std::string, int> order;
  for (int i = 0; i < config_.datasets_size(); ++i) order[config_.datasets(i).name()] = i;
  std::stable_sort(sources.begin(), sources.end(), [&](const RasterSource& a, const RasterSource& b) {
    return std::tie(order[a.dataset], a.depth_band, a.path) < std::tie(order[b.dataset], b.depth_band, b.path);
  });

  SOILHEX_LOG_INFO("Discovered rasters", {StringField("dir", dir.string()), IntField("count", static_cast<int64_t>(sources.size()))});
  return sources;
}

} // namespace soilhex::raster
