#pragma once

#include "task_queue.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace service {

class WorkerPool {
public:
  explicit WorkerPool(size_t num_workers);
  ~WorkerPool() { shutdown(); }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

  // Runs the tasks already queued, then joins the workers.
  void shutdown();
  bool isRunning() const;
  size_t getSize() const;
  size_t getPending() const;

  template <class F, class... Args>
  auto submit(F &&f, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    using PackagedTask = std::packaged_task<ReturnType()>;

    auto bound = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
    auto task = std::make_shared<PackagedTask>(std::move(bound));
    auto future = task->get_future();

    if (!_tasks.push([task]() { (*task)(); })) {
      throw std::runtime_error("Worker pool has been shut down");
    }
    return future;
  }

private:
  void workerLoop();

  std::atomic<bool> _running{false};
  std::vector<std::thread> _workers;
  TaskQueue<std::function<void()>> _tasks;
};

} // namespace service
