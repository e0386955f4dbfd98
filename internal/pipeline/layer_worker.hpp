#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "internal/hex/hex_indexer.hpp"
#include "layer_scheduler.hpp"

namespace soilhex::pipeline {

/*
  Outcome of one layer task. Exactly one of `indexed` or `error` is set.
*/
struct LayerResult {
  std::optional<soilhex::hex::IndexedTable> indexed;
  std::exception_ptr                        error;
};

using LayerProcessor = std::function<soilhex::hex::IndexedTable(const LayerTask&)>;

/*
  Background worker that drains the scheduler.

  Failures are captured per task and surfaced by the caller after the join,
  so one failing layer never leaves other workers blocked.
*/
class LayerWorker {
 public:
  LayerWorker(std::shared_ptr<LayerScheduler> scheduler, LayerProcessor processor, std::vector<LayerResult>& results);
  ~LayerWorker();

  LayerWorker(const LayerWorker&)            = delete;
  LayerWorker& operator=(const LayerWorker&) = delete;

  void Start();
  void Join();

 private:
  void Run();

  std::shared_ptr<LayerScheduler> scheduler_;
  LayerProcessor                  processor_;
  std::vector<LayerResult>&       results_;

  std::thread thread_;
};

} // namespace soilhex::pipeline
