#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace service {

// Blocking FIFO shared by the worker threads. Once closed it rejects new
// items and hands out what is left until empty.
template <typename T> class TaskQueue {
public:
  TaskQueue() = default;
  ~TaskQueue() { clear(); }

  TaskQueue(const TaskQueue &) = delete;
  TaskQueue(TaskQueue &&) = delete;
  TaskQueue &operator=(const TaskQueue &) = delete;
  TaskQueue &operator=(TaskQueue &&) = delete;

  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_closed) {
        return false;
      }
      _items.push_back(std::move(item));
    }
    _ready.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns false once the queue is
  // closed and drained.
  bool waitPop(T &holder) {
    std::unique_lock<std::mutex> lock(_mutex);
    _ready.wait(lock, [this] { return _closed || !_items.empty(); });
    if (_items.empty()) {
      return false;
    }
    holder = std::move(_items.front());
    _items.pop_front();
    return true;
  }

  bool tryPop(T &holder) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_items.empty()) {
      return false;
    }
    holder = std::move(_items.front());
    _items.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _closed = true;
    }
    _ready.notify_all();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _items.clear();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

  size_t getSize() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
  }

private:
  std::deque<T> _items;
  bool _closed{false};
  mutable std::mutex _mutex;
  std::condition_variable _ready;
};

} // namespace service
