#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mural {

// Fixed set of threads draining a bounded FIFO. Tasks must not throw.
class WorkerPool {
public:
  WorkerPool(std::size_t threads, std::size_t max_queue);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False when the queue is full or the pool is stopping.
  bool submit(std::function<void()> task);

  // Blocks until the queue is empty and no task is running.
  void wait_idle();

  // Pending tasks are discarded; running ones finish.
  void stop();

private:
  void run();

  std::size_t max_queue_ = 0;
  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  std::size_t active_ = 0;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace mural
