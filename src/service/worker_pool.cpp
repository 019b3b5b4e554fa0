#include "../../include/service/worker_pool.hpp"

namespace service {

WorkerPool::WorkerPool(size_t num_workers) {
  if (num_workers == 0) {
    throw std::invalid_argument("Worker pool needs at least one worker");
  }
  _workers.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    _workers.emplace_back(&WorkerPool::workerLoop, this);
  }
  _running.store(true);
}

void WorkerPool::workerLoop() {
  std::function<void()> task;
  while (_tasks.waitPop(task)) {
    task();
  }
}

void WorkerPool::shutdown() {
  if (!_running.exchange(false)) {
    return;
  }
  _tasks.close();
  for (auto &worker : _workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool WorkerPool::isRunning() const { return _running.load(); }

size_t WorkerPool::getSize() const { return _workers.size(); }

size_t WorkerPool::getPending() const { return _tasks.getSize(); }

} // namespace service
