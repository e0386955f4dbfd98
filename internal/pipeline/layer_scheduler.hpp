#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "layer_task.hpp"

namespace soilhex::pipeline {

/*
  Thread-safe blocking queue for layer workers.
*/
class LayerScheduler {
 public:
  void Enqueue(LayerTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<LayerTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<LayerTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace soilhex::pipeline
