#include "layer_scheduler.hpp"

namespace soilhex::pipeline {

void LayerScheduler::Enqueue(LayerTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<LayerTask> LayerScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  LayerTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void LayerScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace soilhex::pipeline
