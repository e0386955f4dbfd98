#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace soilhex::util {

/*
  Central error types.

  Everything a pipeline stage can fail with derives from PipelineError so the
  CLI can report the stage and reason uniformly.
*/

class PipelineError : public std::runtime_error {
 public:
  explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidCoordinateError : public PipelineError {
 public:
  explicit InvalidCoordinateError(const std::string& msg) : PipelineError(msg) {
  }
};

class OutOfRegionError : public PipelineError {
 public:
  explicit OutOfRegionError(const std::string& msg) : PipelineError(msg) {
  }
};

class EmptyClipError : public PipelineError {
 public:
  explicit EmptyClipError(const std::string& msg) : PipelineError(msg) {
  }
};

class MissingRequiredPropertyError : public PipelineError {
 public:
  explicit MissingRequiredPropertyError(const std::string& msg) : PipelineError(msg) {
  }
};

class CacheCorruptionError : public PipelineError {
 public:
  explicit CacheCorruptionError(const std::string& msg) : PipelineError(msg) {
  }
};

class RasterReadError : public PipelineError {
 public:
  explicit RasterReadError(const std::string& msg) : PipelineError(msg) {
  }
};

/*
  Wraps a failure with the stage and dataset it happened in.
*/
class StageError : public PipelineError {
 public:
  StageError(std::string stage, std::string dataset, const std::string& reason)
      : PipelineError(stage + " failed for " + dataset + ": " + reason), stage_(std::move(stage)), dataset_(std::move(dataset)) {
  }

  const std::string& stage() const {
    return stage_;
  }

  const std::string& dataset() const {
    return dataset_;
  }

 private:
  std::string stage_;
  std::string dataset_;
};

} // namespace soilhex::util
