#pragma once

#include <cstdint>
#include <string>

namespace escrow {

// Outbound value movement supplied by the hosting environment. send() may
// run arbitrary recipient code, including calls back into the instrument.
class ValueTransport {
public:
  virtual ~ValueTransport() = default;

  // Delivers amount to the recipient. Returns false if delivery did not
  // complete.
  virtual bool send(const std::string &to, uint64_t amount) = 0;

  // Undoes a delivery made by send() when the enclosing call aborts.
  virtual void reclaim(const std::string &from, uint64_t amount) = 0;
};

} // namespace escrow
