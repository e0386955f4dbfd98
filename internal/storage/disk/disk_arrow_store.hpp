#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace soilhex::storage {

/*
  Flat directory of named files written with Arrow IO.

  Properties:
    - atomic replace writes
    - unique temporary name per writer, so concurrent writers never share one
    - optional fsync of the data before rename
*/
class DiskArrowStore {
 public:
  explicit DiskArrowStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& name) const;

  void Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) const;

  // Missing files are not an error. Returns bytes freed.
  uint64_t Remove(const std::string& name) const;

  bool Exists(const std::string& name) const;

  std::vector<std::string> List() const;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace soilhex::storage
