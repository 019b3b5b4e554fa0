#include "../../include/service/memory_transport.hpp"

#include <stdexcept>

namespace service {

bool MemoryTransport::send(const std::string &to, uint64_t amount) {
  ReceiveHook hook;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_refused.count(to) > 0) {
      return false;
    }
    hook = _hook;
  }

  // Recipient code runs unlocked; it may call back into the instrument.
  if (hook && !hook(to, amount)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(_mutex);
  _received[to] += amount;
  _total += amount;
  ++_deliveries;
  return true;
}

void MemoryTransport::reclaim(const std::string &from, uint64_t amount) {
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _received.find(from);
  if (it == _received.end() || it->second < amount) {
    throw std::logic_error("Reclaim exceeds delivered amount for " + from);
  }
  it->second -= amount;
  _total -= amount;
  --_deliveries;
}

void MemoryTransport::refuse(const std::string &address, bool refused) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (refused) {
    _refused.insert(address);
  } else {
    _refused.erase(address);
  }
}

void MemoryTransport::setReceiveHook(ReceiveHook hook) {
  std::lock_guard<std::mutex> lock(_mutex);
  _hook = std::move(hook);
}

uint64_t MemoryTransport::receivedBy(const std::string &address) const {
  std::lock_guard<std::mutex> lock(_mutex);
  if (auto it = _received.find(address); it != _received.end()) {
    return it->second;
  }
  return 0;
}

uint64_t MemoryTransport::totalDelivered() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _total;
}

size_t MemoryTransport::getDeliveryCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _deliveries;
}

} // namespace service
