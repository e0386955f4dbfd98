#include "disk_arrow_store.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/unique_name.hpp"

namespace soilhex::storage {

using namespace soilhex::storage::common;

DiskArrowStore::DiskArrowStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskArrowStore::Read(const std::string& name) const {
  auto path = ArtifactPath(root_, name);

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

/*
  Atomic write:
      write tmp → fsync → rename
*/
void DiskArrowStore::Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) const {
  auto final_path = ArtifactPath(root_, name);
  auto tmp_path   = final_path.string() + kTmpMarker + soilhex::util::UniqueToken();

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync) {
      Unwrap(out->Flush());
      if (::fsync(out->file_descriptor()) != 0) {
        throw std::system_error(errno, std::generic_category(), "fsync " + tmp_path);
      }
    }

    Unwrap(out->Close());
    std::filesystem::rename(tmp_path, final_path);
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

uint64_t DiskArrowStore::Remove(const std::string& name) const {
  auto            path = ArtifactPath(root_, name);
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  if (ec) return 0;
  std::filesystem::remove(path);
  return size;
}

bool DiskArrowStore::Exists(const std::string& name) const {
  return std::filesystem::exists(ArtifactPath(root_, name));
}

std::vector<std::string> DiskArrowStore::List() const {
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (entry.is_regular_file()) names.push_back(entry.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace soilhex::storage
