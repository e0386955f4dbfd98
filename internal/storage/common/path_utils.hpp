#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace soilhex::storage::common {

inline void ValidateArtifactName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("artifact name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("artifact name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("artifact name must not be a relative path component");
  }
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& name) {
  ValidateArtifactName(name);
  return root / name;
}

// Temporary files carry this marker: <name>.tmp.<pid>.<hex token>
inline constexpr const char* kTmpMarker = ".tmp.";

inline bool IsTmpName(const std::string& name) {
  return name.find(kTmpMarker) != std::string::npos;
}

} // namespace soilhex::storage::common
