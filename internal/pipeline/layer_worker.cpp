#include "layer_worker.hpp"

namespace soilhex::pipeline {

LayerWorker::LayerWorker(std::shared_ptr<LayerScheduler> scheduler, LayerProcessor processor, std::vector<LayerResult>& results)
    : scheduler_(std::move(scheduler)), processor_(std::move(processor)), results_(results) {
}

LayerWorker::~LayerWorker() {
  Join();
}

void LayerWorker::Start() {
  thread_ = std::thread(&LayerWorker::Run, this);
}

void LayerWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void LayerWorker::Run() {
  while (auto task = scheduler_->Dequeue()) {
    // each slot is written by exactly one worker
    try {
      results_[task->slot].indexed = processor_(*task);
    } catch (const std::exception&) {
      results_[task->slot].error = std::current_exception();
    }
  }
}

} // namespace soilhex::pipeline
