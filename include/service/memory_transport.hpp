#pragma once

#include "../escrow/value_transport.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace service {

// In-process ValueTransport. Keeps what each address has received and lets
// callers refuse deliveries or run recipient code on delivery.
class MemoryTransport : public escrow::ValueTransport {
public:
  // Runs before the delivery is credited. Returning false rejects it.
  using ReceiveHook = std::function<bool(const std::string &, uint64_t)>;

  bool send(const std::string &to, uint64_t amount) override;
  void reclaim(const std::string &from, uint64_t amount) override;

  void refuse(const std::string &address, bool refused = true);
  void setReceiveHook(ReceiveHook hook);

  uint64_t receivedBy(const std::string &address) const;
  uint64_t totalDelivered() const;
  size_t getDeliveryCount() const;

private:
  std::unordered_map<std::string, uint64_t> _received;
  std::unordered_set<std::string> _refused;
  ReceiveHook _hook;
  uint64_t _total{0};
  size_t _deliveries{0};
  mutable std::mutex _mutex;
};

} // namespace service
